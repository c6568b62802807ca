// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account.hpp>

namespace lantern {

//! Read access to the state at a single block. Readers are noexcept: implementations backed by
//! untrusted sources keep their own failure record and report it once execution is over.
class StateReader {
  public:
    virtual ~StateReader() = default;

    //! std::nullopt when the account does not exist
    virtual std::optional<Account> read_account(const evmc::address& address) const noexcept = 0;

    //! Code whose keccak is code_hash; the returned view stays valid for the lifetime of the reader
    virtual ByteView read_code(const evmc::address& address, const evmc::bytes32& code_hash) const noexcept = 0;

    virtual evmc::bytes32 read_storage(const evmc::address& address, const evmc::bytes32& location) const noexcept = 0;

    //! Hash of an ancestor block for the BLOCKHASH opcode, std::nullopt if unknown
    virtual std::optional<evmc::bytes32> canonical_hash(BlockNum block_num) const noexcept = 0;
};

}  // namespace lantern
