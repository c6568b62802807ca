// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/crypto/bls.hpp>
#include <lantern/lightclient/params/config.hpp>

namespace lantern::cl {

inline constexpr size_t kLogsBloomSize{256};
inline constexpr size_t kMaxExtraDataBytes{32};

// Generalized indices of the light client proofs, see consensus-specs altair/light-client/sync-protocol.md
inline constexpr uint64_t kExecutionPayloadGindex{25};      // BeaconBlockBody.execution_payload
inline constexpr uint64_t kCurrentSyncCommitteeGindex{54};  // BeaconState.current_sync_committee
inline constexpr uint64_t kNextSyncCommitteeGindex{55};     // BeaconState.next_sync_committee
inline constexpr uint64_t kFinalizedRootGindex{105};        // BeaconState.finalized_checkpoint.root

// Electra grows BeaconState beyond 32 fields, adding one level to the state proofs
inline constexpr uint64_t kCurrentSyncCommitteeGindexElectra{86};
inline constexpr uint64_t kNextSyncCommitteeGindexElectra{87};
inline constexpr uint64_t kFinalizedRootGindexElectra{169};

//! Beacon block header, identified by its hash tree root
struct BeaconBlockHeader {
    Slot slot{0};
    uint64_t proposer_index{0};
    Hash32 parent_root;
    Hash32 state_root;
    Hash32 body_root;

    Hash32 hash_tree_root() const;

    friend bool operator==(const BeaconBlockHeader&, const BeaconBlockHeader&) = default;
};

//! Execution block header committed into the beacon block body (Capella layout, Deneb adds the blob gas fields)
struct ExecutionPayloadHeader {
    Hash32 parent_hash;
    evmc::address fee_recipient;
    Hash32 state_root;
    Hash32 receipts_root;
    Bytes logs_bloom = Bytes(kLogsBloomSize, 0);
    Hash32 prev_randao;
    BlockNum block_number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};
    Bytes extra_data;
    intx::uint256 base_fee_per_gas;
    Hash32 block_hash;
    Hash32 transactions_root;
    Hash32 withdrawals_root;
    std::optional<uint64_t> blob_gas_used;    // Deneb
    std::optional<uint64_t> excess_blob_gas;  // Deneb

    Hash32 hash_tree_root() const;

    friend bool operator==(const ExecutionPayloadHeader&, const ExecutionPayloadHeader&) = default;
};

//! Beacon header together with the execution header proven against its body root
struct LightClientHeader {
    BeaconBlockHeader beacon;
    ExecutionPayloadHeader execution;
    std::vector<Hash32> execution_branch;

    //! \brief Checks the execution header against the beacon body root
    bool is_valid_execution_branch() const;

    friend bool operator==(const LightClientHeader&, const LightClientHeader&) = default;
};

//! Sync committee public keys and their aggregate public key
struct SyncCommittee {
    std::vector<bls::PublicKey> public_keys;
    bls::PublicKey aggregate_public_key{};

    Hash32 hash_tree_root() const;

    friend bool operator==(const SyncCommittee&, const SyncCommittee&) = default;
};

//! Participation bitfield of the sync committee and the aggregate signature of the participants
struct SyncAggregate {
    Bytes sync_committee_bits;  // Bitvector[SYNC_COMMITTEE_SIZE], bit i is bit (i % 8) of byte i / 8
    bls::Signature sync_committee_signature{};

    size_t count_participants() const noexcept;

    bool is_participant(size_t index) const noexcept;

    friend bool operator==(const SyncAggregate&, const SyncAggregate&) = default;
};

struct LightClientBootstrap {
    LightClientHeader header;
    SyncCommittee current_sync_committee;
    std::vector<Hash32> current_sync_committee_branch;

    friend bool operator==(const LightClientBootstrap&, const LightClientBootstrap&) = default;
};

struct LightClientUpdate {
    LightClientHeader attested_header;
    std::optional<SyncCommittee> next_sync_committee;
    std::vector<Hash32> next_sync_committee_branch;
    std::optional<LightClientHeader> finalized_header;
    std::vector<Hash32> finality_branch;
    SyncAggregate sync_aggregate;
    Slot signature_slot{0};

    friend bool operator==(const LightClientUpdate&, const LightClientUpdate&) = default;
};

//! Update advancing the finalized header, without committee data
struct LightClientFinalityUpdate {
    LightClientHeader attested_header;
    LightClientHeader finalized_header;
    std::vector<Hash32> finality_branch;
    SyncAggregate sync_aggregate;
    Slot signature_slot{0};

    LightClientUpdate to_update() const;

    friend bool operator==(const LightClientFinalityUpdate&, const LightClientFinalityUpdate&) = default;
};

//! Update advancing the optimistic header only
struct LightClientOptimisticUpdate {
    LightClientHeader attested_header;
    SyncAggregate sync_aggregate;
    Slot signature_slot{0};

    LightClientUpdate to_update() const;

    friend bool operator==(const LightClientOptimisticUpdate&, const LightClientOptimisticUpdate&) = default;
};

//! Bootstrap paired with the trusted checkpoint root it must hash to
struct CheckpointBootstrap {
    Hash32 checkpoint_root;
    LightClientBootstrap bootstrap;
};

//! Any message the light client verifies
using LightClientMessage =
    std::variant<CheckpointBootstrap, LightClientUpdate, LightClientFinalityUpdate, LightClientOptimisticUpdate>;

}  // namespace lantern::cl
