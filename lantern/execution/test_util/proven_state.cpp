// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "proven_state.hpp"

#include <bit>

#include <lantern/core/common/util.hpp>
#include <lantern/core/test_util/trie_builder.hpp>

namespace lantern::test_util {

static StorageTrieBuilder storage_trie(const std::map<evmc::bytes32, evmc::bytes32>& slots) {
    StorageTrieBuilder trie;
    for (const auto& [slot, value] : slots) {
        if (value != evmc::bytes32{}) {
            trie.put(slot, value);
        }
    }
    return trie;
}

void ProvenState::set_storage(const evmc::address& address, const evmc::bytes32& slot, const evmc::bytes32& value) {
    storage_[address][slot] = value;
    accounts_.try_emplace(address);
}

void ProvenState::set_code(const evmc::address& address, ByteView code) {
    code_[address] = Bytes{code};
    accounts_[address].code_hash = std::bit_cast<evmc_bytes32>(keccak256(code));
}

Account ProvenState::account(const evmc::address& address) const {
    const auto it = accounts_.find(address);
    if (it == accounts_.end()) {
        return Account{};
    }
    Account account{it->second};
    if (const auto slots = storage_.find(address); slots != storage_.end()) {
        account.storage_root = storage_trie(slots->second).root();
    }
    return account;
}

evmc::bytes32 ProvenState::state_root() const {
    StateTrieBuilder trie;
    for (const auto& [address, _] : accounts_) {
        trie.put(address, account(address));
    }
    return trie.root();
}

AccountProof ProvenState::get_proof(const evmc::address& address,
                                    const std::vector<evmc::bytes32>& storage_keys) const {
    StateTrieBuilder trie;
    for (const auto& [held, _] : accounts_) {
        trie.put(held, account(held));
    }
    AccountProof proof{
        .address = address,
        .account = account(address),
        .account_proof = trie.proof(address),
    };

    const auto slots = storage_.find(address);
    const std::map<evmc::bytes32, evmc::bytes32> empty;
    const auto& held_slots = slots != storage_.end() ? slots->second : empty;
    const StorageTrieBuilder storage{storage_trie(held_slots)};
    for (const auto& key : storage_keys) {
        const auto value = held_slots.find(key);
        proof.storage_proof.push_back({
            .key = key,
            .value = value != held_slots.end() ? intx::be::load<intx::uint256>(value->second) : intx::uint256{0},
            .proof = storage.proof(key),
        });
    }
    return proof;
}

Bytes ProvenState::code(const evmc::address& address) const {
    const auto it = code_.find(address);
    return it == code_.end() ? Bytes{} : it->second;
}

}  // namespace lantern::test_util
