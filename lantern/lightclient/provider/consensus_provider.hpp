// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <lantern/infra/concurrency/retry.hpp>
#include <lantern/infra/concurrency/task.hpp>
#include <lantern/lightclient/types/types.hpp>
#include <lantern/rpc/common/fallback.hpp>

namespace lantern::cl {

//! Untrusted source of light client data, e.g. a Beacon API endpoint
//! Nothing it returns is trusted before verification
class ConsensusProvider {
  public:
    virtual ~ConsensusProvider() = default;

    virtual Task<LightClientBootstrap> get_bootstrap(const Hash32& block_root) = 0;

    //! Best updates of count sync committee periods starting at start_period
    virtual Task<std::vector<LightClientUpdate>> get_updates(uint64_t start_period, uint64_t count) = 0;

    virtual Task<LightClientFinalityUpdate> get_finality_update() = 0;

    virtual Task<LightClientOptimisticUpdate> get_optimistic_update() = 0;
};

//! ConsensusProvider trying each of several endpoints with retries
class FallbackConsensusProvider : public ConsensusProvider {
  public:
    FallbackConsensusProvider(std::vector<std::shared_ptr<ConsensusProvider>> providers,
                              concurrency::RetryPolicy policy);

    Task<LightClientBootstrap> get_bootstrap(const Hash32& block_root) override;
    Task<std::vector<LightClientUpdate>> get_updates(uint64_t start_period, uint64_t count) override;
    Task<LightClientFinalityUpdate> get_finality_update() override;
    Task<LightClientOptimisticUpdate> get_optimistic_update() override;

  private:
    rpc::ProviderFallback<ConsensusProvider> fallback_;
};

}  // namespace lantern::cl
