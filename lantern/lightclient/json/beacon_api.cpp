// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "beacon_api.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <system_error>
#include <utility>

#include <lantern/rpc/json/types.hpp>

namespace lantern::cl {

static std::string to_decimal(uint64_t number) {
    return std::to_string(number);
}

static uint64_t decimal_from_json(const nlohmann::json& json) {
    return rpc::from_decimal(json.get<std::string>());
}

template <size_t N>
static std::array<uint8_t, N> fixed_bytes_from_json(const nlohmann::json& json) {
    const auto bytes = rpc::bytes_from_json(json);
    if (bytes.size() != N) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                                "expected " + std::to_string(N) + " bytes: " + json.dump()};
    }
    std::array<uint8_t, N> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

template <size_t N>
static std::string fixed_bytes_to_json(const std::array<uint8_t, N>& bytes) {
    return rpc::bytes_to_json(ByteView{bytes.data(), bytes.size()});
}

static bool is_zero_branch(const std::vector<Hash32>& branch) {
    return std::all_of(branch.begin(), branch.end(), [](const Hash32& node) { return node == Hash32{}; });
}

void to_json(nlohmann::json& json, const BeaconBlockHeader& header) {
    json["slot"] = to_decimal(header.slot);
    json["proposer_index"] = to_decimal(header.proposer_index);
    json["parent_root"] = header.parent_root;
    json["state_root"] = header.state_root;
    json["body_root"] = header.body_root;
}

void from_json(const nlohmann::json& json, BeaconBlockHeader& header) {
    header.slot = decimal_from_json(json.at("slot"));
    header.proposer_index = decimal_from_json(json.at("proposer_index"));
    header.parent_root = json.at("parent_root").get<Hash32>();
    header.state_root = json.at("state_root").get<Hash32>();
    header.body_root = json.at("body_root").get<Hash32>();
}

void to_json(nlohmann::json& json, const ExecutionPayloadHeader& header) {
    json["parent_hash"] = header.parent_hash;
    json["fee_recipient"] = header.fee_recipient;
    json["state_root"] = header.state_root;
    json["receipts_root"] = header.receipts_root;
    json["logs_bloom"] = rpc::bytes_to_json(header.logs_bloom);
    json["prev_randao"] = header.prev_randao;
    json["block_number"] = to_decimal(header.block_number);
    json["gas_limit"] = to_decimal(header.gas_limit);
    json["gas_used"] = to_decimal(header.gas_used);
    json["timestamp"] = to_decimal(header.timestamp);
    json["extra_data"] = rpc::bytes_to_json(header.extra_data);
    json["base_fee_per_gas"] = intx::to_string(header.base_fee_per_gas);
    json["block_hash"] = header.block_hash;
    json["transactions_root"] = header.transactions_root;
    json["withdrawals_root"] = header.withdrawals_root;
    if (header.blob_gas_used) {
        json["blob_gas_used"] = to_decimal(*header.blob_gas_used);
    }
    if (header.excess_blob_gas) {
        json["excess_blob_gas"] = to_decimal(*header.excess_blob_gas);
    }
}

void from_json(const nlohmann::json& json, ExecutionPayloadHeader& header) {
    header.parent_hash = json.at("parent_hash").get<Hash32>();
    header.fee_recipient = json.at("fee_recipient").get<evmc::address>();
    header.state_root = json.at("state_root").get<Hash32>();
    header.receipts_root = json.at("receipts_root").get<Hash32>();
    header.logs_bloom = rpc::bytes_from_json(json.at("logs_bloom"));
    if (header.logs_bloom.size() != kLogsBloomSize) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid logs_bloom size"};
    }
    header.prev_randao = json.at("prev_randao").get<Hash32>();
    header.block_number = decimal_from_json(json.at("block_number"));
    header.gas_limit = decimal_from_json(json.at("gas_limit"));
    header.gas_used = decimal_from_json(json.at("gas_used"));
    header.timestamp = decimal_from_json(json.at("timestamp"));
    header.extra_data = rpc::bytes_from_json(json.at("extra_data"));
    if (header.extra_data.size() > kMaxExtraDataBytes) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "extra_data too long"};
    }
    header.base_fee_per_gas = json.at("base_fee_per_gas").get<intx::uint256>();
    header.block_hash = json.at("block_hash").get<Hash32>();
    header.transactions_root = json.at("transactions_root").get<Hash32>();
    header.withdrawals_root = json.at("withdrawals_root").get<Hash32>();
    header.blob_gas_used.reset();
    header.excess_blob_gas.reset();
    if (json.contains("blob_gas_used") || json.contains("excess_blob_gas")) {
        header.blob_gas_used = decimal_from_json(json.at("blob_gas_used"));
        header.excess_blob_gas = decimal_from_json(json.at("excess_blob_gas"));
    }
}

void to_json(nlohmann::json& json, const LightClientHeader& header) {
    json["beacon"] = header.beacon;
    json["execution"] = header.execution;
    json["execution_branch"] = header.execution_branch;
}

void from_json(const nlohmann::json& json, LightClientHeader& header) {
    header.beacon = json.at("beacon").get<BeaconBlockHeader>();
    // Only Capella and later headers carry the execution payload header
    header.execution = json.at("execution").get<ExecutionPayloadHeader>();
    header.execution_branch = json.at("execution_branch").get<std::vector<Hash32>>();
}

void to_json(nlohmann::json& json, const SyncCommittee& committee) {
    auto public_keys = nlohmann::json::array();
    for (const auto& key : committee.public_keys) {
        public_keys.push_back(fixed_bytes_to_json(key));
    }
    json["pubkeys"] = std::move(public_keys);
    json["aggregate_pubkey"] = fixed_bytes_to_json(committee.aggregate_public_key);
}

void from_json(const nlohmann::json& json, SyncCommittee& committee) {
    const auto& public_keys = json.at("pubkeys");
    committee.public_keys.clear();
    committee.public_keys.reserve(public_keys.size());
    for (const auto& key : public_keys) {
        committee.public_keys.push_back(fixed_bytes_from_json<bls::kPublicKeySize>(key));
    }
    committee.aggregate_public_key = fixed_bytes_from_json<bls::kPublicKeySize>(json.at("aggregate_pubkey"));
}

void to_json(nlohmann::json& json, const SyncAggregate& aggregate) {
    json["sync_committee_bits"] = rpc::bytes_to_json(aggregate.sync_committee_bits);
    json["sync_committee_signature"] = fixed_bytes_to_json(aggregate.sync_committee_signature);
}

void from_json(const nlohmann::json& json, SyncAggregate& aggregate) {
    aggregate.sync_committee_bits = rpc::bytes_from_json(json.at("sync_committee_bits"));
    aggregate.sync_committee_signature = fixed_bytes_from_json<bls::kSignatureSize>(json.at("sync_committee_signature"));
}

void to_json(nlohmann::json& json, const LightClientBootstrap& bootstrap) {
    json["header"] = bootstrap.header;
    json["current_sync_committee"] = bootstrap.current_sync_committee;
    json["current_sync_committee_branch"] = bootstrap.current_sync_committee_branch;
}

void from_json(const nlohmann::json& json, LightClientBootstrap& bootstrap) {
    bootstrap.header = json.at("header").get<LightClientHeader>();
    bootstrap.current_sync_committee = json.at("current_sync_committee").get<SyncCommittee>();
    bootstrap.current_sync_committee_branch = json.at("current_sync_committee_branch").get<std::vector<Hash32>>();
}

void to_json(nlohmann::json& json, const LightClientUpdate& update) {
    json["attested_header"] = update.attested_header;
    if (update.next_sync_committee) {
        json["next_sync_committee"] = *update.next_sync_committee;
        json["next_sync_committee_branch"] = update.next_sync_committee_branch;
    }
    if (update.finalized_header) {
        json["finalized_header"] = *update.finalized_header;
        json["finality_branch"] = update.finality_branch;
    }
    json["sync_aggregate"] = update.sync_aggregate;
    json["signature_slot"] = to_decimal(update.signature_slot);
}

void from_json(const nlohmann::json& json, LightClientUpdate& update) {
    update.attested_header = json.at("attested_header").get<LightClientHeader>();
    update.next_sync_committee.reset();
    update.next_sync_committee_branch.clear();
    if (json.contains("next_sync_committee")) {
        auto branch = json.at("next_sync_committee_branch").get<std::vector<Hash32>>();
        if (!is_zero_branch(branch)) {
            update.next_sync_committee = json.at("next_sync_committee").get<SyncCommittee>();
            update.next_sync_committee_branch = std::move(branch);
        }
    }
    update.finalized_header.reset();
    update.finality_branch.clear();
    if (json.contains("finalized_header")) {
        auto branch = json.at("finality_branch").get<std::vector<Hash32>>();
        if (!is_zero_branch(branch)) {
            update.finalized_header = json.at("finalized_header").get<LightClientHeader>();
            update.finality_branch = std::move(branch);
        }
    }
    update.sync_aggregate = json.at("sync_aggregate").get<SyncAggregate>();
    update.signature_slot = decimal_from_json(json.at("signature_slot"));
}

void to_json(nlohmann::json& json, const LightClientFinalityUpdate& update) {
    json["attested_header"] = update.attested_header;
    json["finalized_header"] = update.finalized_header;
    json["finality_branch"] = update.finality_branch;
    json["sync_aggregate"] = update.sync_aggregate;
    json["signature_slot"] = to_decimal(update.signature_slot);
}

void from_json(const nlohmann::json& json, LightClientFinalityUpdate& update) {
    update.attested_header = json.at("attested_header").get<LightClientHeader>();
    update.finalized_header = json.at("finalized_header").get<LightClientHeader>();
    update.finality_branch = json.at("finality_branch").get<std::vector<Hash32>>();
    update.sync_aggregate = json.at("sync_aggregate").get<SyncAggregate>();
    update.signature_slot = decimal_from_json(json.at("signature_slot"));
}

void to_json(nlohmann::json& json, const LightClientOptimisticUpdate& update) {
    json["attested_header"] = update.attested_header;
    json["sync_aggregate"] = update.sync_aggregate;
    json["signature_slot"] = to_decimal(update.signature_slot);
}

void from_json(const nlohmann::json& json, LightClientOptimisticUpdate& update) {
    update.attested_header = json.at("attested_header").get<LightClientHeader>();
    update.sync_aggregate = json.at("sync_aggregate").get<SyncAggregate>();
    update.signature_slot = decimal_from_json(json.at("signature_slot"));
}

std::vector<LightClientUpdate> decode_updates_response(const nlohmann::json& json) {
    std::vector<LightClientUpdate> updates;
    updates.reserve(json.size());
    for (const auto& item : json) {
        updates.push_back(decode_response<LightClientUpdate>(item));
    }
    return updates;
}

}  // namespace lantern::cl
