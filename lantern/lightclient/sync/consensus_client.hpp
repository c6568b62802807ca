// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <lantern/infra/concurrency/task.hpp>
#include <lantern/lightclient/params/config.hpp>
#include <lantern/lightclient/provider/consensus_provider.hpp>
#include <lantern/lightclient/state/store.hpp>
#include <lantern/lightclient/sync/head_feed.hpp>
#include <lantern/lightclient/sync/processor.hpp>
#include <lantern/lightclient/util/time.hpp>

namespace lantern::cl {

struct SyncSettings {
    //! Root of the trusted beacon block header to bootstrap from
    Hash32 checkpoint_root;
    //! Refuse checkpoints older than max_checkpoint_age instead of just warning
    bool strict_checkpoint_age{false};
    //! Weak subjectivity period bound for the checkpoint
    std::chrono::seconds max_checkpoint_age{std::chrono::hours{24 * 14}};
    //! Number of trusted headers kept for block number lookups
    size_t header_history_size{64};
    //! Upper bound of sync committee periods per get_updates request
    uint64_t max_request_updates{128};
};

//! Follows the beacon chain from a trusted checkpoint, verifying every light client message
//! before it touches the store, and publishes the trusted heads on a HeadFeed
class ConsensusClient {
  public:
    ConsensusClient(ConsensusConfig config, std::shared_ptr<ConsensusProvider> provider, SyncSettings settings,
                    SlotClock clock);

    //! \brief Bootstraps, catches up with the chain and then advances once per slot until cancelled
    Task<void> run();

    //! \brief Fetches and verifies the bootstrap of the checkpoint
    //! \throws std::runtime_error if the bootstrap does not verify or the checkpoint is too old in strict mode
    Task<void> bootstrap();

    //! \brief Applies the best updates of every period from the finalized one up to the current one,
    //! then the latest finality and optimistic updates
    Task<void> sync();

    //! \brief Applies the latest finality and optimistic updates, learning the next committee if missing
    Task<void> advance();

    //! \brief Verifies and applies one message, publishing the new heads on success
    //! \remarks a rejected message is logged and leaves the store unchanged
    ProcessResult process(const LightClientMessage& message);

    HeadFeed& head_feed() { return head_feed_; }

    const ConsensusConfig& config() const { return config_; }

    SyncState sync_state() const { return state_; }

    const std::optional<LightClientStore>& store() const { return store_; }

    Slot expected_current_slot() const { return clock_.current_slot(); }

  private:
    void check_checkpoint_age(const LightClientHeader& checkpoint) const;

    ConsensusConfig config_;
    std::shared_ptr<ConsensusProvider> provider_;
    SyncSettings settings_;
    SlotClock clock_;

    std::optional<LightClientStore> store_;
    SyncState state_{SyncState::kUnsynced};
    HeadFeed head_feed_;
};

}  // namespace lantern::cl
