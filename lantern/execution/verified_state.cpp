// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "verified_state.hpp"

#include <algorithm>
#include <bit>
#include <future>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/common/util.hpp>
#include <lantern/core/trie/proof.hpp>
#include <lantern/core/types/address.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>
#include <lantern/execution/errors.hpp>
#include <lantern/infra/common/log.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::execution {

static std::optional<Account> existing(const Account& account) {
    if (account == Account{}) {
        return std::nullopt;
    }
    return account;
}

static evmc::bytes32 find_slot(const AccountProof& proof, const evmc::bytes32& slot) {
    const auto it = std::find_if(proof.storage_proof.begin(), proof.storage_proof.end(),
                                 [&](const StorageProof& storage) { return storage.key == slot; });
    if (it == proof.storage_proof.end()) {
        throw ExecutionError{ExecutionErrorCode::kProofUnavailable,
                             "no proof of slot " + to_hex(slot, true) + " for " + address_to_hex(proof.address)};
    }
    return intx::be::store<evmc::bytes32>(it->value);
}

Task<AccountProof> VerifiedStateView::fetch_proof(const evmc::address& address,
                                                  std::vector<evmc::bytes32> storage_keys) {
    LANTERN_TRACE << "VerifiedStateView: get_proof " << address << " keys=" << storage_keys.size()
                  << " block=" << block_number_;
    AccountProof proof;
    try {
        proof = co_await provider_.get_proof(address, std::move(storage_keys), block_number_);
    } catch (const rpc::ProviderError& e) {
        throw ExecutionError{ExecutionErrorCode::kProviderExhausted, e.what()};
    }
    if (proof.address != address) {
        throw ExecutionError{ExecutionErrorCode::kInvalidProof,
                             "proof of " + address_to_hex(proof.address) + " instead of " + address_to_hex(address)};
    }
    co_return proof;
}

Account VerifiedStateView::verify(const AccountProof& proof) const {
    const auto account = trie::verify_account_proof(state_root_, proof);
    if (!account) {
        LANTERN_ERROR << "VerifiedStateView: invalid proof of " << proof.address << " at block " << block_number_
                      << ": " << trie::to_string(account.error());
        throw ExecutionError{ExecutionErrorCode::kInvalidProof,
                             address_to_hex(proof.address) + ": " + std::string{trie::to_string(account.error())}};
    }
    return *account;
}

Task<std::optional<Account>> VerifiedStateView::read_account(const evmc::address& address) {
    co_return co_await cache_.account(state_root_, address, [this, address]() -> Task<std::optional<Account>> {
        const AccountProof proof = co_await fetch_proof(address, {});
        co_return existing(verify(proof));
    });
}

Task<evmc::bytes32> VerifiedStateView::read_storage(const evmc::address& address, const evmc::bytes32& slot) {
    const auto account = co_await read_account(address);
    if (!account || account->storage_root == kEmptyRoot) {
        co_return evmc::bytes32{};
    }
    co_return co_await cache_.storage(state_root_, address, slot, [this, address, slot]() -> Task<evmc::bytes32> {
        const AccountProof proof = co_await fetch_proof(address, {slot});
        verify(proof);
        co_return find_slot(proof, slot);
    });
}

Task<Bytes> VerifiedStateView::read_code(const evmc::address& address, const evmc::bytes32& code_hash) {
    if (code_hash == kEmptyHash) {
        co_return Bytes{};
    }
    co_return co_await cache_.code(code_hash, [this, address, code_hash]() -> Task<Bytes> {
        Bytes code;
        try {
            code = co_await provider_.get_code(address, block_number_);
        } catch (const rpc::ProviderError& e) {
            throw ExecutionError{ExecutionErrorCode::kProviderExhausted, e.what()};
        }
        const evmc::bytes32 hash{std::bit_cast<evmc_bytes32>(keccak256(code))};
        if (hash != code_hash) {
            LANTERN_ERROR << "VerifiedStateView: code of " << address << " hashes to " << to_hex(hash, true)
                          << " instead of " << to_hex(code_hash, true);
            throw ExecutionError{ExecutionErrorCode::kInvalidCode, "code of " + address_to_hex(address)};
        }
        co_return code;
    });
}

Task<void> VerifiedStateView::prefetch(const std::vector<AccessListEntry>& access_list) {
    for (const auto& entry : access_list) {
        const evmc::address address{entry.account};
        std::map<evmc::bytes32, evmc::bytes32> proven_slots;
        const auto account = co_await cache_.account(
            state_root_, address, [&, address]() -> Task<std::optional<Account>> {
                const AccountProof proof = co_await fetch_proof(address, entry.storage_keys);
                const Account verified{verify(proof)};
                for (const auto& key : entry.storage_keys) {
                    proven_slots.emplace(key, find_slot(proof, key));
                }
                co_return existing(verified);
            });
        if (!account || account->storage_root == kEmptyRoot) {
            continue;
        }
        for (const auto& key : entry.storage_keys) {
            co_await cache_.storage(state_root_, address, key, [&, address, key]() -> Task<evmc::bytes32> {
                if (const auto it = proven_slots.find(key); it != proven_slots.end()) {
                    co_return it->second;
                }
                const AccountProof proof = co_await fetch_proof(address, {key});
                verify(proof);
                co_return find_slot(proof, key);
            });
        }
        if (account->code_hash != kEmptyHash) {
            co_await read_code(address, account->code_hash);
        }
    }
}

template <typename T>
std::optional<T> VerifiedStateReader::wait_for(Task<T> task, std::string_view what) const noexcept {
    if (faulted()) {
        return std::nullopt;
    }
    try {
        std::future<T> result{boost::asio::co_spawn(executor_, std::move(task), boost::asio::use_future)};
        return result.get();
    } catch (const std::exception& e) {
        LANTERN_DEBUG << "VerifiedStateReader::" << what << " failed: " << e.what();
        std::scoped_lock lock{mutex_};
        if (!fault_) {
            fault_ = std::current_exception();
        }
        return std::nullopt;
    }
}

std::optional<Account> VerifiedStateReader::read_account(const evmc::address& address) const noexcept {
    const auto account = wait_for(view_.read_account(address), "read_account");
    return account ? *account : std::nullopt;
}

ByteView VerifiedStateReader::read_code(const evmc::address& address, const evmc::bytes32& code_hash) const noexcept {
    {
        std::scoped_lock lock{mutex_};
        if (const auto it = code_.find(code_hash); it != code_.end()) {
            return it->second;
        }
    }
    auto code = wait_for(view_.read_code(address, code_hash), "read_code");
    if (!code) {
        return {};
    }
    std::scoped_lock lock{mutex_};
    const auto [it, _] = code_.emplace(code_hash, std::move(*code));
    return it->second;
}

evmc::bytes32 VerifiedStateReader::read_storage(const evmc::address& address,
                                                const evmc::bytes32& location) const noexcept {
    return wait_for(view_.read_storage(address, location), "read_storage").value_or(evmc::bytes32{});
}

std::optional<evmc::bytes32> VerifiedStateReader::canonical_hash(BlockNum block_num) const noexcept {
    const auto it = known_hashes_.find(block_num);
    if (it == known_hashes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VerifiedStateReader::faulted() const {
    std::scoped_lock lock{mutex_};
    return fault_ != nullptr;
}

void VerifiedStateReader::rethrow_if_faulted() const {
    std::scoped_lock lock{mutex_};
    if (fault_) {
        std::rethrow_exception(fault_);
    }
}

}  // namespace lantern::execution
