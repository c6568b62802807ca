// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "processor.hpp"

#include <algorithm>
#include <utility>
#include <variant>
#include <vector>

#include <lantern/core/common/overloaded.hpp>
#include <lantern/core/crypto/bls.hpp>
#include <lantern/lightclient/fork/fork.hpp>
#include <lantern/lightclient/ssz/merkle.hpp>

namespace lantern::cl {

static uint64_t current_committee_gindex(const BeaconChainConfig& bcc, Slot slot) {
    return bcc.fork_at_slot(slot) >= Fork::kElectra ? kCurrentSyncCommitteeGindexElectra : kCurrentSyncCommitteeGindex;
}

static uint64_t next_committee_gindex(const BeaconChainConfig& bcc, Slot slot) {
    return bcc.fork_at_slot(slot) >= Fork::kElectra ? kNextSyncCommitteeGindexElectra : kNextSyncCommitteeGindex;
}

static uint64_t finalized_root_gindex(const BeaconChainConfig& bcc, Slot slot) {
    return bcc.fork_at_slot(slot) >= Fork::kElectra ? kFinalizedRootGindexElectra : kFinalizedRootGindex;
}

//! Safety threshold for optimistic updates: half of the highest recent participation
static uint64_t safety_threshold(const LightClientStore& store) {
    return std::max(store.previous_max_active_participants, store.current_max_active_participants) / 2;
}

BootstrapResult bootstrap(const Hash32& checkpoint_root, const LightClientBootstrap& bootstrap,
                          const ConsensusConfig& config) {
    const auto& bcc = config.beacon_chain_config;
    const auto& header = bootstrap.header;
    if (header.beacon.hash_tree_root() != checkpoint_root) {
        return tl::unexpected{BootstrapError::kCheckpointMismatch};
    }
    if (!header.is_valid_execution_branch()) {
        return tl::unexpected{BootstrapError::kInvalidExecutionProof};
    }
    const auto& committee = bootstrap.current_sync_committee;
    if (committee.public_keys.size() != bcc.sync_committee_size) {
        return tl::unexpected{BootstrapError::kInvalidCommitteeProof};
    }
    if (!ssz::is_valid_merkle_branch(committee.hash_tree_root(), bootstrap.current_sync_committee_branch,
                                     current_committee_gindex(bcc, header.beacon.slot), header.beacon.state_root)) {
        return tl::unexpected{BootstrapError::kInvalidCommitteeProof};
    }

    LightClientStore store;
    store.finalized_index = store.headers.insert(header);
    store.optimistic_index = store.finalized_index;
    store.current_sync_committee = committee;
    return store;
}

tl::expected<void, ConsensusError> validate_update(const LightClientStore& store, const LightClientUpdate& update,
                                                   const ConsensusConfig& config, Slot current_slot) {
    const auto& bcc = config.beacon_chain_config;
    const auto& attested = update.attested_header.beacon;
    const auto& store_finalized = store.finalized_header().beacon;
    const auto store_period = bcc.sync_committee_period(store_finalized.slot);

    // Relevance: the update must change the optimistic head, the finalized head or the known committees
    const bool newer_finalized = update.finalized_header && update.finalized_header->beacon.slot > store_finalized.slot;
    const bool supplies_next_committee = !store.next_sync_committee && update.next_sync_committee &&
                                         bcc.sync_committee_period(attested.slot) == store_period;
    if (attested.slot <= store.optimistic_header().beacon.slot && !newer_finalized && !supplies_next_committee) {
        return tl::unexpected{ConsensusError::kNotRelevant};
    }

    // current_slot + 1 tolerates a clock lagging at most one slot behind the signers
    const Slot update_finalized_slot{update.finalized_header ? update.finalized_header->beacon.slot : 0};
    if (update.signature_slot <= attested.slot || attested.slot < update_finalized_slot ||
        update.signature_slot > current_slot + 1) {
        return tl::unexpected{ConsensusError::kInvalidTimestamp};
    }

    const auto signature_period = bcc.sync_committee_period(update.signature_slot);
    const SyncCommittee* committee{nullptr};
    if (signature_period == store_period) {
        committee = &store.current_sync_committee;
    } else if (signature_period == store_period + 1) {
        if (!store.next_sync_committee) {
            return tl::unexpected{ConsensusError::kMissingNextCommittee};
        }
        committee = &*store.next_sync_committee;
    } else {
        return tl::unexpected{ConsensusError::kInvalidPeriod};
    }

    const auto& aggregate = update.sync_aggregate;
    const size_t committee_size{committee->public_keys.size()};
    if (aggregate.sync_committee_bits.size() * 8 != committee_size ||
        aggregate.count_participants() * 3 < committee_size * 2) {
        return tl::unexpected{ConsensusError::kInsufficientParticipation};
    }

    if (!update.attested_header.is_valid_execution_branch() ||
        (update.finalized_header && !update.finalized_header->is_valid_execution_branch())) {
        return tl::unexpected{ConsensusError::kInvalidExecutionProof};
    }

    if (update.finalized_header) {
        const auto finalized_root = update.finalized_header->beacon.hash_tree_root();
        if (!ssz::is_valid_merkle_branch(finalized_root, update.finality_branch,
                                         finalized_root_gindex(bcc, attested.slot), attested.state_root)) {
            return tl::unexpected{ConsensusError::kInvalidFinalityProof};
        }
    }

    if (update.next_sync_committee) {
        const auto& next_committee = *update.next_sync_committee;
        if (next_committee.public_keys.size() != bcc.sync_committee_size ||
            !ssz::is_valid_merkle_branch(next_committee.hash_tree_root(), update.next_sync_committee_branch,
                                         next_committee_gindex(bcc, attested.slot), attested.state_root)) {
            return tl::unexpected{ConsensusError::kInvalidCommitteeProof};
        }
    }

    std::vector<bls::PublicKey> participants;
    participants.reserve(committee_size);
    for (size_t i{0}; i < committee_size; ++i) {
        if (aggregate.is_participant(i)) {
            participants.push_back(committee->public_keys[i]);
        }
    }
    const auto signing_root = compute_sync_committee_signing_root(config, attested.hash_tree_root(), update.signature_slot);
    if (!bls::fast_aggregate_verify(participants, ByteView{signing_root.bytes}, aggregate.sync_committee_signature)) {
        return tl::unexpected{ConsensusError::kInvalidSignature};
    }

    return {};
}

UpdateResult apply_update(LightClientStore& store, const LightClientUpdate& update, const ConsensusConfig& config,
                          Slot current_slot) {
    if (const auto valid = validate_update(store, update, config, current_slot); !valid) {
        return tl::unexpected{valid.error()};
    }

    // Nothing below can fail: the store is mutated only by valid updates
    const auto& bcc = config.beacon_chain_config;
    UpdateOutcome outcome;
    const uint64_t participants{update.sync_aggregate.count_participants()};
    store.current_max_active_participants = std::max(store.current_max_active_participants, participants);

    const auto store_period = bcc.sync_committee_period(store.finalized_header().beacon.slot);
    const auto attested_period = bcc.sync_committee_period(update.attested_header.beacon.slot);
    if (!store.next_sync_committee) {
        if (update.next_sync_committee && attested_period == store_period) {
            store.next_sync_committee = update.next_sync_committee;
            outcome.next_committee_learned = true;
        }
    } else if (update.finalized_header &&
               bcc.sync_committee_period(update.finalized_header->beacon.slot) == store_period + 1) {
        store.current_sync_committee = std::move(*store.next_sync_committee);
        store.next_sync_committee = update.next_sync_committee;
        store.previous_max_active_participants = store.current_max_active_participants;
        store.current_max_active_participants = 0;
        outcome.committee_rotated = true;
    }

    if (update.finalized_header && update.finalized_header->beacon.slot > store.finalized_header().beacon.slot) {
        store.finalized_index = store.headers.insert(*update.finalized_header);
        outcome.finalized_advanced = true;
    }

    const auto& attested = update.attested_header;
    if (participants > safety_threshold(store) && attested.beacon.slot > store.optimistic_header().beacon.slot) {
        store.optimistic_index = store.headers.insert(attested);
        outcome.optimistic_advanced = true;
    }
    if (store.finalized_header().beacon.slot > store.optimistic_header().beacon.slot) {
        store.optimistic_index = store.finalized_index;
        outcome.optimistic_advanced = true;
    }

    return outcome;
}

std::string_view to_string(const ProcessError& error) noexcept {
    return std::visit([](auto e) { return to_string(e); }, error);
}

ProcessResult process(std::optional<LightClientStore>& store, const LightClientMessage& message,
                      const ConsensusConfig& config, Slot current_slot) {
    const auto apply = [&](const LightClientUpdate& update) -> ProcessResult {
        if (!store) {
            return tl::unexpected{ProcessError{ConsensusError::kNotBootstrapped}};
        }
        auto result = apply_update(*store, update, config, current_slot);
        if (!result) {
            return tl::unexpected{ProcessError{result.error()}};
        }
        return *result;
    };

    return std::visit(
        Overloaded{
            [&](const CheckpointBootstrap& checkpoint) -> ProcessResult {
                auto result = bootstrap(checkpoint.checkpoint_root, checkpoint.bootstrap, config);
                if (!result) {
                    return tl::unexpected{ProcessError{result.error()}};
                }
                store = std::move(*result);
                return UpdateOutcome{.optimistic_advanced = true, .finalized_advanced = true};
            },
            [&](const LightClientUpdate& update) { return apply(update); },
            [&](const LightClientFinalityUpdate& update) { return apply(update.to_update()); },
            [&](const LightClientOptimisticUpdate& update) { return apply(update.to_update()); },
        },
        message);
}

}  // namespace lantern::cl
