// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/common/bytes.hpp>

namespace lantern {

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account;
    std::vector<evmc::bytes32> storage_keys;

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

//! A read-only message call as submitted by eth_call / eth_estimateGas
struct CallRequest {
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;  // contract creation if not set
    std::optional<uint64_t> gas;      // block gas limit if not set
    intx::uint256 gas_price{0};
    intx::uint256 value{0};
    Bytes data;
    std::vector<AccessListEntry> access_list;

    bool is_create() const noexcept { return !to; }

    friend bool operator==(const CallRequest&, const CallRequest&) = default;
};

}  // namespace lantern
