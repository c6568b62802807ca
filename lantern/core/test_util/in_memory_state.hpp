// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <bit>
#include <map>

#include <lantern/core/common/util.hpp>
#include <lantern/core/state/state_reader.hpp>

namespace lantern::test_util {

//! StateReader over plain maps, counting the reads it serves
class InMemoryState : public StateReader {
  public:
    void set_account(const evmc::address& address, const Account& account) { accounts_[address] = account; }

    //! Stores code and points the account at it
    void set_code(const evmc::address& address, ByteView code) {
        const ethash::hash256 hash{keccak256(code)};
        const evmc::bytes32 code_hash{std::bit_cast<evmc_bytes32>(hash)};
        code_[code_hash] = Bytes{code};
        accounts_[address].code_hash = code_hash;
    }

    void set_storage(const evmc::address& address, const evmc::bytes32& location, const evmc::bytes32& value) {
        storage_[address][location] = value;
    }

    void set_canonical_hash(BlockNum block_num, const evmc::bytes32& hash) { hashes_[block_num] = hash; }

    std::optional<Account> read_account(const evmc::address& address) const noexcept override {
        ++reads_;
        const auto it{accounts_.find(address)};
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    ByteView read_code(const evmc::address&, const evmc::bytes32& code_hash) const noexcept override {
        ++reads_;
        const auto it{code_.find(code_hash)};
        return it == code_.end() ? ByteView{} : ByteView{it->second};
    }

    evmc::bytes32 read_storage(const evmc::address& address, const evmc::bytes32& location) const noexcept override {
        ++reads_;
        const auto it{storage_.find(address)};
        if (it == storage_.end()) {
            return {};
        }
        const auto value{it->second.find(location)};
        return value == it->second.end() ? evmc::bytes32{} : value->second;
    }

    std::optional<evmc::bytes32> canonical_hash(BlockNum block_num) const noexcept override {
        const auto it{hashes_.find(block_num)};
        if (it == hashes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t reads() const { return reads_; }

  private:
    std::map<evmc::address, Account> accounts_;
    std::map<evmc::bytes32, Bytes> code_;
    std::map<evmc::address, std::map<evmc::bytes32, evmc::bytes32>> storage_;
    std::map<BlockNum, evmc::bytes32> hashes_;
    mutable size_t reads_{0};
};

}  // namespace lantern::test_util
