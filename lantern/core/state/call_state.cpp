// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "call_state.hpp"

#include <bit>
#include <utility>

#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/common/overloaded.hpp>
#include <lantern/core/common/util.hpp>

namespace lantern {

const std::optional<Account>& CallState::get_account(const evmc::address& address) const noexcept {
    auto it{accounts_.find(address)};
    if (it == accounts_.end()) {
        it = accounts_.emplace(address, reader_.read_account(address)).first;
    }
    return it->second;
}

Account& CallState::update_account(const evmc::address& address) noexcept {
    const std::optional<Account>& current{get_account(address)};
    journal_.emplace_back(AccountUpdated{address, current});
    std::optional<Account>& account{accounts_[address]};
    if (!account) {
        account = Account{};
    }
    return *account;
}

bool CallState::exists(const evmc::address& address) const noexcept { return get_account(address).has_value(); }

bool CallState::is_dead(const evmc::address& address) const noexcept {
    const std::optional<Account>& account{get_account(address)};
    return !account || account->empty();
}

void CallState::create_contract(const evmc::address& address) noexcept {
    const std::optional<Account>& previous{get_account(address)};

    Storage previous_storage;
    if (auto it{storage_.find(address)}; it != storage_.end()) {
        previous_storage = std::move(it->second);
        storage_.erase(it);
    }
    journal_.emplace_back(ContractCreated{address, previous, std::move(previous_storage), created_.contains(address)});

    Account created;
    if (previous) {
        created.balance = previous->balance;
    }
    accounts_[address] = created;
    created_.insert(address);
}

bool CallState::record_self_destruct(const evmc::address& address) noexcept {
    const bool inserted{self_destructs_.insert(address).second};
    if (inserted) {
        journal_.emplace_back(SelfDestructed{address});
    }
    return inserted;
}

bool CallState::is_self_destructed(const evmc::address& address) const noexcept {
    return self_destructs_.contains(address);
}

intx::uint256 CallState::get_balance(const evmc::address& address) const noexcept {
    const std::optional<Account>& account{get_account(address)};
    return account ? account->balance : 0;
}

void CallState::set_balance(const evmc::address& address, const intx::uint256& value) noexcept {
    update_account(address).balance = value;
}

void CallState::add_to_balance(const evmc::address& address, const intx::uint256& addend) noexcept {
    update_account(address).balance += addend;
}

void CallState::subtract_from_balance(const evmc::address& address, const intx::uint256& subtrahend) noexcept {
    update_account(address).balance -= subtrahend;
}

uint64_t CallState::get_nonce(const evmc::address& address) const noexcept {
    const std::optional<Account>& account{get_account(address)};
    return account ? account->nonce : 0;
}

void CallState::set_nonce(const evmc::address& address, uint64_t nonce) noexcept {
    update_account(address).nonce = nonce;
}

ByteView CallState::get_code(const evmc::address& address) const noexcept {
    const std::optional<Account>& account{get_account(address)};
    if (!account || account->code_hash == kEmptyHash) {
        return {};
    }
    const evmc::bytes32& code_hash{account->code_hash};
    if (auto it{new_code_.find(code_hash)}; it != new_code_.end()) {
        return it->second;
    }
    if (auto it{existing_code_.find(code_hash)}; it != existing_code_.end()) {
        return it->second;
    }
    const ByteView code{reader_.read_code(address, code_hash)};
    existing_code_.emplace(code_hash, code);
    return code;
}

evmc::bytes32 CallState::get_code_hash(const evmc::address& address) const noexcept {
    const std::optional<Account>& account{get_account(address)};
    return account ? account->code_hash : kEmptyHash;
}

void CallState::set_code(const evmc::address& address, ByteView code) noexcept {
    Account& account{update_account(address)};
    account.code_hash = std::bit_cast<evmc_bytes32>(keccak256(code));
    // Don't overwrite already existing code so that views of it
    // that were previously returned by get_code() are still valid.
    new_code_.try_emplace(account.code_hash, code);
}

evmc_access_status CallState::access_account(const evmc::address& address) noexcept {
    const bool cold_read{accessed_addresses_.insert(address).second};
    if (cold_read) {
        journal_.emplace_back(AccountAccessed{address});
    }
    return cold_read ? EVMC_ACCESS_COLD : EVMC_ACCESS_WARM;
}

evmc_access_status CallState::access_storage(const evmc::address& address, const evmc::bytes32& key) noexcept {
    const bool cold_read{accessed_storage_keys_[address].insert(key).second};
    if (cold_read) {
        journal_.emplace_back(StorageAccessed{address, key});
    }
    return cold_read ? EVMC_ACCESS_COLD : EVMC_ACCESS_WARM;
}

evmc::bytes32 CallState::get_current_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept {
    if (auto it{storage_.find(address)}; it != storage_.end()) {
        if (auto current{it->second.current.find(key)}; current != it->second.current.end()) {
            return current->second;
        }
    }
    return get_original_storage(address, key);
}

evmc::bytes32 CallState::get_original_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept {
    // Storage of contracts created by this call starts empty
    if (created_.contains(address) || !get_account(address)) {
        return {};
    }
    Storage& storage{storage_[address]};
    if (auto it{storage.original.find(key)}; it != storage.original.end()) {
        return it->second;
    }
    const evmc::bytes32 value{reader_.read_storage(address, key)};
    storage.original.emplace(key, value);
    return value;
}

void CallState::set_storage(const evmc::address& address, const evmc::bytes32& key,
                            const evmc::bytes32& value) noexcept {
    const evmc::bytes32 previous{get_current_storage(address, key)};
    if (previous == value) {
        return;
    }
    storage_[address].current[key] = value;
    journal_.emplace_back(StorageChanged{address, key, previous});
}

evmc::bytes32 CallState::get_transient_storage(const evmc::address& address,
                                               const evmc::bytes32& key) const noexcept {
    const auto it{transient_storage_.find(address)};
    if (it == transient_storage_.end()) {
        return {};
    }
    const auto value{it->second.find(key)};
    return value == it->second.end() ? evmc::bytes32{} : value->second;
}

void CallState::set_transient_storage(const evmc::address& address, const evmc::bytes32& key,
                                      const evmc::bytes32& value) noexcept {
    evmc::bytes32& slot{transient_storage_[address][key]};
    journal_.emplace_back(TransientStorageChanged{address, key, slot});
    slot = value;
}

CallState::Snapshot CallState::take_snapshot() const noexcept {
    Snapshot snapshot;
    snapshot.journal_size_ = journal_.size();
    snapshot.log_size_ = logs_.size();
    return snapshot;
}

void CallState::revert_to_snapshot(const Snapshot& snapshot) noexcept {
    for (size_t i{journal_.size()}; i > snapshot.journal_size_; --i) {
        revert(journal_[i - 1]);
    }
    journal_.resize(snapshot.journal_size_);
    logs_.resize(snapshot.log_size_);
}

void CallState::revert(JournalEntry& entry) noexcept {
    std::visit(
        Overloaded{
            [&](AccountUpdated& e) { accounts_[e.address] = e.previous; },
            [&](ContractCreated& e) {
                accounts_[e.address] = e.previous;
                storage_[e.address] = std::move(e.previous_storage);
                if (!e.was_created) {
                    created_.erase(e.address);
                }
            },
            [&](StorageChanged& e) { storage_[e.address].current[e.key] = e.previous; },
            [&](TransientStorageChanged& e) { transient_storage_[e.address][e.key] = e.previous; },
            [&](SelfDestructed& e) { self_destructs_.erase(e.address); },
            [&](AccountAccessed& e) { accessed_addresses_.erase(e.address); },
            [&](StorageAccessed& e) { accessed_storage_keys_[e.address].erase(e.key); },
        },
        entry);
}

}  // namespace lantern
