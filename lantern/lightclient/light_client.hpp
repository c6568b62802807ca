// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <lantern/execution/block_tag.hpp>
#include <lantern/execution/execution_client.hpp>
#include <lantern/execution/proof_cache.hpp>
#include <lantern/execution/provider.hpp>
#include <lantern/infra/concurrency/async_task.hpp>
#include <lantern/infra/concurrency/retry.hpp>
#include <lantern/lightclient/params/config.hpp>
#include <lantern/lightclient/provider/consensus_provider.hpp>
#include <lantern/lightclient/sync/consensus_client.hpp>
#include <lantern/lightclient/util/time.hpp>

namespace lantern::cl {

struct Settings {
    //! Name of a built-in network preset, used unless consensus_config is given
    std::string network{"mainnet"};
    std::optional<ConsensusConfig> consensus_config;
    //! Root of the trusted beacon block header to bootstrap from
    Hash32 checkpoint_root;
    uint32_t num_contexts{1};
    uint32_t num_workers{concurrency::kDefaultNumWorkers};
    concurrency::RetryPolicy retry_policy;
    execution::BlockTagPolicy block_tags;
    execution::ProofCacheSettings proof_cache;
    size_t header_history_size{64};
    uint64_t max_request_updates{128};
    bool strict_checkpoint_age{false};
    std::chrono::seconds max_checkpoint_age{std::chrono::hours{24 * 14}};
    //! Wall clock, Unix time in milliseconds
    SlotClock::TimeSource now{current_unix_time_ms};
};

class LightClientImpl;

//! Trustless light client: follows the beacon chain from a checkpoint in the background and
//! answers execution queries proven against the heads it verified
class LightClient {
  public:
    //! \throws std::invalid_argument for an unknown network or an empty provider list
    LightClient(Settings settings, std::vector<std::shared_ptr<ConsensusProvider>> consensus_providers,
                std::vector<std::shared_ptr<execution::ExecutionProvider>> execution_providers);
    ~LightClient();

    LightClient(const LightClient&) = delete;
    LightClient& operator=(const LightClient&) = delete;

    void start();
    void stop();

    //! \brief Waits for the sync task to end and stops the execution threads
    //! \throws the failure that ended the sync task, e.g. a rejected checkpoint
    void join();

    ConsensusClient& consensus();
    execution::ExecutionClient& execution();

  private:
    std::unique_ptr<LightClientImpl> p_impl_;
};

}  // namespace lantern::cl
