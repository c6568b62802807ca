// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/common/decoding_result.hpp>
#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>

namespace lantern {

//! Account as committed into the state trie: the leaf value is RLP([nonce, balance, storage_root, code_hash])
struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 storage_root{kEmptyRoot};
    evmc::bytes32 code_hash{kEmptyHash};

    //! \brief Serialize the account into its Recursive-Length Prefix (RLP) representation
    Bytes rlp() const;

    //! \brief See EIP-161: an empty account has no code, zero nonce and zero balance
    bool empty() const noexcept { return nonce == 0 && balance == 0 && code_hash == kEmptyHash; }

    friend bool operator==(const Account&, const Account&) = default;

    std::string to_string() const;
};

//! \brief Decode an account from the RLP representation held in a state trie leaf
tl::expected<Account, DecodingError> decode_account(ByteView encoded) noexcept;

}  // namespace lantern
