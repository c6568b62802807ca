// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <bit>

#include <lantern/lightclient/ssz/merkle.hpp>

namespace lantern::cl {

Hash32 BeaconBlockHeader::hash_tree_root() const {
    const std::vector<ssz::Chunk> fields{
        ssz::to_chunk(slot),
        ssz::to_chunk(proposer_index),
        parent_root,
        state_root,
        body_root,
    };
    return ssz::merkleize(fields);
}

Hash32 ExecutionPayloadHeader::hash_tree_root() const {
    std::vector<ssz::Chunk> fields{
        parent_hash,
        ssz::to_chunk(fee_recipient),
        state_root,
        receipts_root,
        ssz::hash_tree_root(logs_bloom),
        prev_randao,
        ssz::to_chunk(block_number),
        ssz::to_chunk(gas_limit),
        ssz::to_chunk(gas_used),
        ssz::to_chunk(timestamp),
        ssz::hash_tree_root_byte_list(extra_data, kMaxExtraDataBytes),
        ssz::to_chunk(base_fee_per_gas),
        block_hash,
        transactions_root,
        withdrawals_root,
    };
    if (blob_gas_used && excess_blob_gas) {
        fields.push_back(ssz::to_chunk(*blob_gas_used));
        fields.push_back(ssz::to_chunk(*excess_blob_gas));
    }
    return ssz::merkleize(fields);
}

bool LightClientHeader::is_valid_execution_branch() const {
    return ssz::is_valid_merkle_branch(execution.hash_tree_root(), execution_branch, kExecutionPayloadGindex,
                                       beacon.body_root);
}

Hash32 SyncCommittee::hash_tree_root() const {
    std::vector<ssz::Chunk> key_roots;
    key_roots.reserve(public_keys.size());
    for (const auto& key : public_keys) {
        key_roots.push_back(ssz::hash_tree_root(key));
    }
    const std::vector<ssz::Chunk> fields{
        ssz::merkleize(key_roots),
        ssz::hash_tree_root(aggregate_public_key),
    };
    return ssz::merkleize(fields);
}

size_t SyncAggregate::count_participants() const noexcept {
    size_t count{0};
    for (const auto byte : sync_committee_bits) {
        count += static_cast<size_t>(std::popcount(byte));
    }
    return count;
}

bool SyncAggregate::is_participant(size_t index) const noexcept {
    const size_t byte_index{index / 8};
    if (byte_index >= sync_committee_bits.size()) {
        return false;
    }
    return (sync_committee_bits[byte_index] >> (index % 8)) & 1;
}

LightClientUpdate LightClientFinalityUpdate::to_update() const {
    return LightClientUpdate{
        .attested_header = attested_header,
        .finalized_header = finalized_header,
        .finality_branch = finality_branch,
        .sync_aggregate = sync_aggregate,
        .signature_slot = signature_slot,
    };
}

LightClientUpdate LightClientOptimisticUpdate::to_update() const {
    return LightClientUpdate{
        .attested_header = attested_header,
        .sync_aggregate = sync_aggregate,
        .signature_slot = signature_slot,
    };
}

}  // namespace lantern::cl
