// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof_cache.hpp"

#include <utility>

#include <lantern/infra/common/log.hpp>

namespace lantern::execution {

ProofCache::ProofCache(const ProofCacheSettings& settings)
    : accounts_{settings.max_accounts}, storage_{settings.max_storage_slots}, code_{settings.max_code_entries} {}

Task<std::optional<Account>> ProofCache::account(
    const evmc::bytes32& state_root, const evmc::address& address,
    concurrency::SingleFlightMap<AccountKey, std::optional<Account>>::Fetch fetch) {
    co_return co_await accounts_.get({state_root, address}, std::move(fetch));
}

Task<evmc::bytes32> ProofCache::storage(const evmc::bytes32& state_root, const evmc::address& address,
                                        const evmc::bytes32& slot,
                                        concurrency::SingleFlightMap<StorageKey, evmc::bytes32>::Fetch fetch) {
    co_return co_await storage_.get({state_root, address, slot}, std::move(fetch));
}

Task<Bytes> ProofCache::code(const evmc::bytes32& code_hash,
                             concurrency::SingleFlightMap<evmc::bytes32, Bytes>::Fetch fetch) {
    co_return co_await code_.get(code_hash, std::move(fetch));
}

void ProofCache::retain(const std::set<evmc::bytes32>& state_roots) {
    const size_t accounts = accounts_.erase_if([&](const AccountKey& key) { return !state_roots.contains(key.first); });
    const size_t slots = storage_.erase_if(
        [&](const StorageKey& key) { return !state_roots.contains(std::get<0>(key)); });
    if (accounts > 0 || slots > 0) {
        LANTERN_DEBUG << "ProofCache: evicted accounts=" << accounts << " slots=" << slots
                      << " live roots=" << state_roots.size();
    }
}

ProofCache::Stats ProofCache::stats() const {
    return {
        .accounts = accounts_.size(),
        .storage_slots = storage_.size(),
        .code_entries = code_.size(),
        .fetches = accounts_.fetches() + storage_.fetches() + code_.fetches(),
    };
}

}  // namespace lantern::execution
