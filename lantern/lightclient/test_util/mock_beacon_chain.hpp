// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <evmc/evmc.hpp>

#include <lantern/core/test_util/bls_signer.hpp>
#include <lantern/lightclient/params/config.hpp>
#include <lantern/lightclient/types/types.hpp>

namespace lantern::test_util {

//! A beacon block header together with the state proofs a light client server would serve for it
struct MockBlock {
    cl::LightClientHeader header;
    std::vector<cl::Hash32> current_sync_committee_branch;
    std::vector<cl::Hash32> next_sync_committee_branch;
    std::vector<cl::Hash32> finality_branch;

    cl::Hash32 root() const { return header.beacon.hash_tree_root(); }
};

//! Minimal preset network whose sync committees are made of deterministic BLS keys
class MockBeaconChain {
  public:
    static constexpr uint64_t kGenesisTime{1'700'000'000};

    MockBeaconChain();

    const cl::ConsensusConfig& config() const { return config_; }

    //! The sync committee of period, created on first use
    const cl::SyncCommittee& committee(uint64_t period);

    //! \brief Builds a block at slot whose state commits to finalized_root as its finalized checkpoint
    //! \param execution_state_root state root of the execution payload carried by the block
    MockBlock make_block(Slot slot, const cl::Hash32& finalized_root = {},
                         const evmc::bytes32& execution_state_root = {});

    cl::LightClientBootstrap make_bootstrap(const MockBlock& block);

    //! \brief Update for attested signed at signature_slot by the first participants members of the signing committee
    cl::LightClientUpdate make_update(const MockBlock& attested, Slot signature_slot, size_t participants,
                                      const MockBlock* finalized = nullptr, bool with_next_committee = false);

    cl::SyncAggregate sign(const cl::Hash32& attested_root, Slot signature_slot, size_t participants);

    uint64_t committee_size() const { return config_.beacon_chain_config.sync_committee_size; }

    Slot slots_per_period() const { return config_.beacon_chain_config.slots_per_sync_committee_period(); }

    //! Unix time at which slot starts
    uint64_t slot_time(Slot slot) const { return kGenesisTime + slot * config_.beacon_chain_config.seconds_per_slot; }

  private:
    struct Committee {
        std::vector<BlsSigner> signers;
        cl::SyncCommittee sync_committee;
    };

    Committee& committee_members(uint64_t period);

    cl::ConsensusConfig config_;
    std::map<uint64_t, Committee> committees_;
    cl::Hash32 parent_root_;
};

}  // namespace lantern::test_util
