// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/common/base.hpp>

namespace lantern {

//! The block a call executes on top of, as committed by a verified execution payload header
struct BlockEnv {
    BlockNum number{0};
    BlockTime timestamp{0};
    evmc::bytes32 hash;
    evmc::bytes32 parent_hash;
    evmc::bytes32 state_root;
    evmc::address coinbase;
    uint64_t gas_limit{0};
    intx::uint256 base_fee_per_gas{0};
    evmc::bytes32 prev_randao;
    std::optional<uint64_t> excess_blob_gas;  // EIP-4844
};

}  // namespace lantern
