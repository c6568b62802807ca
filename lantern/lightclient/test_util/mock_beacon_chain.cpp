// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "mock_beacon_chain.hpp"

#include <stdexcept>

#include <lantern/core/crypto/sha256.hpp>
#include <lantern/lightclient/fork/fork.hpp>
#include <lantern/lightclient/ssz/merkle.hpp>
#include <lantern/lightclient/test_util/ssz_tree.hpp>

namespace lantern::test_util {

using namespace evmc::literals;

// Beacon state leaves that no light client proof touches
static constexpr uint64_t kGenesisTimeGindex{32};
static constexpr uint64_t kFinalizedEpochGindex{104};
// Beacon block body leaf next to the execution payload
static constexpr uint64_t kBlsToExecutionChangesGindex{24};

MockBeaconChain::MockBeaconChain() {
    config_.genesis_config = {
        .genesis_validators_root = 0x5c4c1b2a1f4e0d8f6b3b4c9e1a7f2d0c8b6a4e2f0d1c3b5a79e8f6d4c2b0a1f3_bytes32,
        .genesis_time = kGenesisTime,
    };
    config_.beacon_chain_config = cl::kMinimalBeaconConfig;
    config_.chain_config = kSepoliaConfig;
}

MockBeaconChain::Committee& MockBeaconChain::committee_members(uint64_t period) {
    auto [it, inserted] = committees_.try_emplace(period);
    if (inserted) {
        auto& committee = it->second;
        for (uint64_t i{0}; i < committee_size(); ++i) {
            const auto& signer = committee.signers.emplace_back(period * 1000 + i);
            committee.sync_committee.public_keys.push_back(signer.public_key());
        }
        const auto aggregate = bls::aggregate_public_keys(committee.sync_committee.public_keys);
        if (!aggregate) {
            throw std::logic_error{"cannot aggregate sync committee keys"};
        }
        committee.sync_committee.aggregate_public_key = *aggregate;
    }
    return it->second;
}

const cl::SyncCommittee& MockBeaconChain::committee(uint64_t period) {
    return committee_members(period).sync_committee;
}

MockBlock MockBeaconChain::make_block(Slot slot, const cl::Hash32& finalized_root,
                                      const evmc::bytes32& execution_state_root) {
    const auto& bcc = config_.beacon_chain_config;
    MockBlock block;

    auto& execution = block.header.execution;
    execution.parent_hash = sha256(ssz::to_chunk(slot - 1), ssz::to_chunk(uint64_t{0}));
    execution.state_root = execution_state_root;
    execution.block_number = slot;
    execution.gas_limit = 30'000'000;
    execution.gas_used = 21'000;
    execution.timestamp = slot_time(slot);
    execution.base_fee_per_gas = 7;
    execution.block_hash = sha256(ssz::to_chunk(slot), ssz::to_chunk(uint64_t{0}));
    execution.blob_gas_used = 0;
    execution.excess_blob_gas = 0;

    SszTree body;
    body.set(kBlsToExecutionChangesGindex, ssz::to_chunk(slot));
    body.set(cl::kExecutionPayloadGindex, execution.hash_tree_root());
    block.header.execution_branch = body.branch(cl::kExecutionPayloadGindex);

    const uint64_t period{bcc.sync_committee_period(slot)};
    SszTree state;
    state.set(kGenesisTimeGindex, ssz::to_chunk(kGenesisTime));
    state.set(cl::kCurrentSyncCommitteeGindex, committee(period).hash_tree_root());
    state.set(cl::kNextSyncCommitteeGindex, committee(period + 1).hash_tree_root());
    state.set(kFinalizedEpochGindex, ssz::to_chunk(bcc.compute_epoch_at_slot(slot)));
    state.set(cl::kFinalizedRootGindex, finalized_root);
    block.current_sync_committee_branch = state.branch(cl::kCurrentSyncCommitteeGindex);
    block.next_sync_committee_branch = state.branch(cl::kNextSyncCommitteeGindex);
    block.finality_branch = state.branch(cl::kFinalizedRootGindex);

    block.header.beacon = {
        .slot = slot,
        .proposer_index = slot % 64,
        .parent_root = parent_root_,
        .state_root = state.root(),
        .body_root = body.root(),
    };
    parent_root_ = block.root();
    return block;
}

cl::LightClientBootstrap MockBeaconChain::make_bootstrap(const MockBlock& block) {
    const uint64_t period{config_.beacon_chain_config.sync_committee_period(block.header.beacon.slot)};
    return {
        .header = block.header,
        .current_sync_committee = committee(period),
        .current_sync_committee_branch = block.current_sync_committee_branch,
    };
}

cl::LightClientUpdate MockBeaconChain::make_update(const MockBlock& attested, Slot signature_slot,
                                                   size_t participants, const MockBlock* finalized,
                                                   bool with_next_committee) {
    cl::LightClientUpdate update{
        .attested_header = attested.header,
        .sync_aggregate = sign(attested.root(), signature_slot, participants),
        .signature_slot = signature_slot,
    };
    if (finalized) {
        update.finalized_header = finalized->header;
        update.finality_branch = attested.finality_branch;
    }
    if (with_next_committee) {
        const uint64_t period{config_.beacon_chain_config.sync_committee_period(attested.header.beacon.slot)};
        update.next_sync_committee = committee(period + 1);
        update.next_sync_committee_branch = attested.next_sync_committee_branch;
    }
    return update;
}

cl::SyncAggregate MockBeaconChain::sign(const cl::Hash32& attested_root, Slot signature_slot, size_t participants) {
    const uint64_t period{config_.beacon_chain_config.sync_committee_period(signature_slot)};
    const auto& members = committee_members(period);
    const auto signing_root = cl::compute_sync_committee_signing_root(config_, attested_root, signature_slot);

    cl::SyncAggregate aggregate;
    aggregate.sync_committee_bits.assign(committee_size() / 8, 0);
    std::vector<bls::Signature> signatures;
    for (size_t i{0}; i < participants && i < members.signers.size(); ++i) {
        aggregate.sync_committee_bits[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        signatures.push_back(members.signers[i].sign(ByteView{signing_root.bytes}));
    }
    if (!signatures.empty()) {
        aggregate.sync_committee_signature = aggregate_signatures(signatures);
    }
    return aggregate;
}

}  // namespace lantern::test_util
