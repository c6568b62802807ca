// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "consensus_provider.hpp"

#include <string>
#include <utility>

#include <lantern/core/types/evmc_bytes32.hpp>

namespace lantern::cl {

FallbackConsensusProvider::FallbackConsensusProvider(std::vector<std::shared_ptr<ConsensusProvider>> providers,
                                                     concurrency::RetryPolicy policy)
    : fallback_{std::move(providers), policy} {}

Task<LightClientBootstrap> FallbackConsensusProvider::get_bootstrap(const Hash32& block_root) {
    co_return co_await fallback_.request<LightClientBootstrap>(
        [block_root](ConsensusProvider& provider) { return provider.get_bootstrap(block_root); },
        "get_bootstrap " + to_hex(block_root, true));
}

Task<std::vector<LightClientUpdate>> FallbackConsensusProvider::get_updates(uint64_t start_period, uint64_t count) {
    co_return co_await fallback_.request<std::vector<LightClientUpdate>>(
        [=](ConsensusProvider& provider) { return provider.get_updates(start_period, count); },
        "get_updates " + std::to_string(start_period) + "+" + std::to_string(count));
}

Task<LightClientFinalityUpdate> FallbackConsensusProvider::get_finality_update() {
    co_return co_await fallback_.request<LightClientFinalityUpdate>(
        [](ConsensusProvider& provider) { return provider.get_finality_update(); }, "get_finality_update");
}

Task<LightClientOptimisticUpdate> FallbackConsensusProvider::get_optimistic_update() {
    co_return co_await fallback_.request<LightClientOptimisticUpdate>(
        [](ConsensusProvider& provider) { return provider.get_optimistic_update(); }, "get_optimistic_update");
}

}  // namespace lantern::cl
