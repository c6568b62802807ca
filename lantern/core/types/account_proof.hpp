// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account.hpp>

namespace lantern {

//! Merkle proof of one storage slot as returned by eth_getProof (EIP-1186)
struct StorageProof {
    evmc::bytes32 key;
    intx::uint256 value;
    std::vector<Bytes> proof;

    friend bool operator==(const StorageProof&, const StorageProof&) = default;
};

//! Merkle proof of an account and some of its storage slots as returned by eth_getProof (EIP-1186)
//! The account fields are claims of the provider until verified against a trusted state root
struct AccountProof {
    evmc::address address;
    Account account;
    std::vector<Bytes> account_proof;
    std::vector<StorageProof> storage_proof;

    friend bool operator==(const AccountProof&, const AccountProof&) = default;
};

}  // namespace lantern
