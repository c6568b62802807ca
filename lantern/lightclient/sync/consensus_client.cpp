// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "consensus_client.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <lantern/core/types/evmc_bytes32.hpp>
#include <lantern/infra/common/ensure.hpp>
#include <lantern/infra/common/log.hpp>
#include <lantern/infra/concurrency/sleep.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::cl {

ConsensusClient::ConsensusClient(ConsensusConfig config, std::shared_ptr<ConsensusProvider> provider,
                                 SyncSettings settings, SlotClock clock)
    : config_{std::move(config)},
      provider_{std::move(provider)},
      settings_{std::move(settings)},
      clock_{std::move(clock)} {}

Task<void> ConsensusClient::run() {
    // Unreachable providers only delay the startup, a rejected checkpoint ends the task
    while (true) {
        try {
            co_await bootstrap();
            break;
        } catch (const rpc::ProviderError& e) {
            LANTERN_WARN << "[Checkpoint Sync] Cannot bootstrap: " << e.what();
        }
        co_await sleep(clock_.duration_to_next_slot());
    }
    while (true) {
        try {
            co_await sync();
            break;
        } catch (const rpc::ProviderError& e) {
            LANTERN_WARN << "[LightClient] Cannot sync: " << e.what();
        }
        co_await sleep(clock_.duration_to_next_slot());
    }
    while (true) {
        co_await sleep(clock_.duration_to_next_slot());
        try {
            co_await advance();
        } catch (const rpc::ProviderError& e) {
            LANTERN_WARN << "[LightClient] Cannot advance: " << e.what();
        }
    }
}

Task<void> ConsensusClient::bootstrap() {
    LANTERN_INFO << "[Checkpoint Sync] Requesting bootstrap [root: " << to_hex(settings_.checkpoint_root, true) << "]";
    auto data = co_await provider_->get_bootstrap(settings_.checkpoint_root);
    check_checkpoint_age(data.header);

    const auto result = process(CheckpointBootstrap{.checkpoint_root = settings_.checkpoint_root, .bootstrap = std::move(data)});
    if (!result) {
        throw std::runtime_error{"bootstrap rejected: " + std::string{to_string(result.error())}};
    }
    const auto& finalized = store_->finalized_header();
    LANTERN_INFO << "[LightClient] Store initialized [slot: " << finalized.beacon.slot
                 << " block: " << finalized.execution.block_number << "]";
}

void ConsensusClient::check_checkpoint_age(const LightClientHeader& checkpoint) const {
    const auto& bcc = config_.beacon_chain_config;
    const Slot current_slot{clock_.current_slot()};
    const Slot checkpoint_slot{checkpoint.beacon.slot};
    if (current_slot <= checkpoint_slot) {
        return;
    }
    const std::chrono::seconds age{(current_slot - checkpoint_slot) * bcc.seconds_per_slot};
    if (age <= settings_.max_checkpoint_age) {
        return;
    }
    if (settings_.strict_checkpoint_age) {
        throw std::runtime_error{"checkpoint too old: " + std::to_string(age.count()) + "s"};
    }
    LANTERN_WARN << "[Checkpoint Sync] Checkpoint older than the weak subjectivity period [age: " << age.count()
                 << "s]";
}

Task<void> ConsensusClient::sync() {
    ensure(store_.has_value(), "ConsensusClient::sync: not bootstrapped");
    const auto& bcc = config_.beacon_chain_config;
    const uint64_t current_period{bcc.sync_committee_period(clock_.current_slot())};
    uint64_t period{bcc.sync_committee_period(store_->finalized_header().beacon.slot)};
    while (period <= current_period) {
        const uint64_t count{std::min(current_period - period + 1, settings_.max_request_updates)};
        const auto updates = co_await provider_->get_updates(period, count);
        LANTERN_DEBUG << "[LightClient] Received " << updates.size() << " updates [period: " << period << "]";
        for (const auto& update : updates) {
            process(update);
        }
        const uint64_t reached_period{bcc.sync_committee_period(store_->finalized_header().beacon.slot)};
        if (updates.empty() || reached_period <= period) {
            break;
        }
        period = reached_period;
    }

    process(co_await provider_->get_finality_update());
    process(co_await provider_->get_optimistic_update());
    LANTERN_INFO << "[LightClient] Synced [finalized: " << store_->finalized_header().beacon.slot
                 << " optimistic: " << store_->optimistic_header().beacon.slot << "]";
}

Task<void> ConsensusClient::advance() {
    ensure(store_.has_value(), "ConsensusClient::advance: not bootstrapped");
    process(co_await provider_->get_finality_update());

    if (!store_->next_sync_committee) {
        const uint64_t current_period{config_.beacon_chain_config.sync_committee_period(clock_.current_slot())};
        const auto updates = co_await provider_->get_updates(current_period, 1);
        for (const auto& update : updates) {
            process(update);
        }
    }

    process(co_await provider_->get_optimistic_update());
}

ProcessResult ConsensusClient::process(const LightClientMessage& message) {
    auto result = cl::process(store_, message, config_, clock_.current_slot());
    if (!result) {
        const auto* consensus_error = std::get_if<ConsensusError>(&result.error());
        if (consensus_error && *consensus_error == ConsensusError::kNotRelevant) {
            LANTERN_TRACE << "[LightClient] Update not relevant";
        } else {
            LANTERN_WARN << "[LightClient] Message dropped [reason: " << to_string(result.error()) << "]";
        }
        return result;
    }

    const auto& outcome = *result;
    if (std::holds_alternative<CheckpointBootstrap>(message)) {
        state_ = SyncState::kBootstrapped;
    } else if (outcome.optimistic_advanced || outcome.finalized_advanced) {
        const bool finalized{store_->optimistic_header().beacon.slot == store_->finalized_header().beacon.slot};
        state_ = finalized ? SyncState::kFinalized : SyncState::kOptimistic;
    }
    if (outcome.committee_rotated) {
        LANTERN_INFO << "[LightClient] Sync committee rotated [period: "
                     << config_.beacon_chain_config.sync_committee_period(store_->finalized_header().beacon.slot)
                     << "]";
    }
    if (outcome.finalized_advanced) {
        const auto& finalized = store_->finalized_header();
        LANTERN_INFO << "[LightClient] Finalized head [slot: " << finalized.beacon.slot
                     << " block: " << finalized.execution.block_number << "]";
    }
    if (outcome.optimistic_advanced) {
        const auto& optimistic = store_->optimistic_header();
        LANTERN_INFO << "[LightClient] Optimistic head [slot: " << optimistic.beacon.slot
                     << " block: " << optimistic.execution.block_number << "]";
    }

    const std::array<HeaderArena::Index*, 2> pinned{&store_->finalized_index, &store_->optimistic_index};
    store_->headers.prune(settings_.header_history_size, pinned);
    head_feed_.publish(*store_, state_);
    return result;
}

}  // namespace lantern::cl
