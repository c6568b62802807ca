// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <vector>

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account.hpp>
#include <lantern/core/types/account_proof.hpp>

namespace lantern::test_util {

//! World state kept in plain maps that answers eth_getProof and eth_getCode like an honest node
class ProvenState {
  public:
    void set_account(const evmc::address& address, const Account& account) { accounts_[address] = account; }

    void set_storage(const evmc::address& address, const evmc::bytes32& slot, const evmc::bytes32& value);

    //! Stores code and points the account at it
    void set_code(const evmc::address& address, ByteView code);

    //! The account with its storage root computed from the stored slots, Account{} if absent
    Account account(const evmc::address& address) const;

    evmc::bytes32 state_root() const;

    AccountProof get_proof(const evmc::address& address, const std::vector<evmc::bytes32>& storage_keys) const;

    Bytes code(const evmc::address& address) const;

  private:
    std::map<evmc::address, Account> accounts_;
    std::map<evmc::address, std::map<evmc::bytes32, evmc::bytes32>> storage_;
    std::map<evmc::address, Bytes> code_;
};

}  // namespace lantern::test_util
