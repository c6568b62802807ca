// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <catch2/catch_test_macros.hpp>

#include <lantern/lightclient/ssz/merkle.hpp>
#include <lantern/lightclient/test_util/mock_beacon_chain.hpp>

namespace lantern::cl {

TEST_CASE("BeaconBlockHeader hash_tree_root", "[lightclient][types]") {
    // Five zero fields padded to eight chunks
    CHECK(BeaconBlockHeader{}.hash_tree_root() == ssz::zero_hash(3));

    BeaconBlockHeader header{.slot = 1};
    CHECK(header.hash_tree_root() != ssz::zero_hash(3));
    const auto root = header.hash_tree_root();
    header.proposer_index = 1;
    CHECK(header.hash_tree_root() != root);
}

TEST_CASE("ExecutionPayloadHeader hash_tree_root", "[lightclient][types]") {
    ExecutionPayloadHeader capella;
    capella.block_number = 100;
    ExecutionPayloadHeader deneb{capella};
    deneb.blob_gas_used = 0;
    deneb.excess_blob_gas = 0;
    CHECK(capella.hash_tree_root() != deneb.hash_tree_root());

    ExecutionPayloadHeader with_extra{capella};
    with_extra.extra_data = Bytes{0x01};
    CHECK(with_extra.hash_tree_root() != capella.hash_tree_root());
}

TEST_CASE("LightClientHeader is_valid_execution_branch", "[lightclient][types]") {
    test_util::MockBeaconChain chain;
    auto header = chain.make_block(4).header;
    CHECK(header.is_valid_execution_branch());

    SECTION("payload changed") {
        header.execution.block_number += 1;
        CHECK_FALSE(header.is_valid_execution_branch());
    }
    SECTION("branch too short") {
        header.execution_branch.pop_back();
        CHECK_FALSE(header.is_valid_execution_branch());
    }
    SECTION("no branch") {
        header.execution_branch.clear();
        CHECK_FALSE(header.is_valid_execution_branch());
    }
}

TEST_CASE("SyncAggregate participants", "[lightclient][types]") {
    SyncAggregate aggregate{.sync_committee_bits = Bytes{0x01, 0x80, 0xff, 0x00}};
    CHECK(aggregate.count_participants() == 10);
    CHECK(aggregate.is_participant(0));
    CHECK_FALSE(aggregate.is_participant(1));
    CHECK(aggregate.is_participant(15));
    CHECK(aggregate.is_participant(16));
    CHECK_FALSE(aggregate.is_participant(24));
    CHECK_FALSE(aggregate.is_participant(32));
}

TEST_CASE("SyncCommittee hash_tree_root", "[lightclient][types]") {
    test_util::MockBeaconChain chain;
    auto committee = chain.committee(0);
    const auto root = committee.hash_tree_root();
    CHECK(root == chain.committee(0).hash_tree_root());
    CHECK(root != chain.committee(1).hash_tree_root());

    std::swap(committee.public_keys[0], committee.public_keys[1]);
    CHECK(committee.hash_tree_root() != root);
}

TEST_CASE("Light client updates to_update", "[lightclient][types]") {
    test_util::MockBeaconChain chain;
    const auto finalized = chain.make_block(8);
    const auto attested = chain.make_block(16, finalized.root());
    const auto aggregate = chain.sign(attested.root(), 17, 32);

    const LightClientFinalityUpdate finality{
        .attested_header = attested.header,
        .finalized_header = finalized.header,
        .finality_branch = attested.finality_branch,
        .sync_aggregate = aggregate,
        .signature_slot = 17,
    };
    const auto from_finality = finality.to_update();
    CHECK(from_finality.attested_header == attested.header);
    CHECK(from_finality.finalized_header == finalized.header);
    CHECK(from_finality.finality_branch == attested.finality_branch);
    CHECK_FALSE(from_finality.next_sync_committee);
    CHECK(from_finality.sync_aggregate == aggregate);
    CHECK(from_finality.signature_slot == 17);

    const LightClientOptimisticUpdate optimistic{
        .attested_header = attested.header,
        .sync_aggregate = aggregate,
        .signature_slot = 17,
    };
    const auto from_optimistic = optimistic.to_update();
    CHECK(from_optimistic.attested_header == attested.header);
    CHECK_FALSE(from_optimistic.finalized_header);
    CHECK(from_optimistic.finality_branch.empty());
    CHECK(from_optimistic.signature_slot == 17);
}

}  // namespace lantern::cl
