// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <lantern/core/types/evmc_bytes32.hpp>
#include <lantern/rpc/json/types.hpp>

namespace lantern {

static nlohmann::json proof_nodes_to_json(const std::vector<Bytes>& nodes) {
    auto json = nlohmann::json::array();
    for (const auto& node : nodes) {
        json.push_back(rpc::bytes_to_json(node));
    }
    return json;
}

static std::vector<Bytes> proof_nodes_from_json(const nlohmann::json& json) {
    std::vector<Bytes> nodes;
    nodes.reserve(json.size());
    for (const auto& node : json) {
        nodes.push_back(rpc::bytes_from_json(node));
    }
    return nodes;
}

void to_json(nlohmann::json& json, const StorageProof& proof) {
    json["key"] = proof.key;
    json["value"] = rpc::to_quantity(proof.value);
    json["proof"] = proof_nodes_to_json(proof.proof);
}

void from_json(const nlohmann::json& json, StorageProof& proof) {
    // Providers echo the requested key, which may be shorter than 32 bytes
    proof.key = to_bytes32(rpc::bytes_from_json(json.at("key")));
    proof.value = json.at("value").get<intx::uint256>();
    proof.proof = proof_nodes_from_json(json.at("proof"));
}

void to_json(nlohmann::json& json, const AccountProof& proof) {
    json["address"] = proof.address;
    json["accountProof"] = proof_nodes_to_json(proof.account_proof);
    json["balance"] = rpc::to_quantity(proof.account.balance);
    json["codeHash"] = proof.account.code_hash;
    json["nonce"] = rpc::to_quantity(proof.account.nonce);
    json["storageHash"] = proof.account.storage_root;
    json["storageProof"] = proof.storage_proof;
}

void from_json(const nlohmann::json& json, AccountProof& proof) {
    proof.address = json.at("address").get<evmc::address>();
    proof.account_proof = proof_nodes_from_json(json.at("accountProof"));
    proof.account.balance = json.at("balance").get<intx::uint256>();
    proof.account.code_hash = json.at("codeHash").get<evmc::bytes32>();
    proof.account.nonce = rpc::from_quantity(json.at("nonce").get<std::string>());
    proof.account.storage_root = json.at("storageHash").get<evmc::bytes32>();
    proof.storage_proof = json.at("storageProof").get<std::vector<StorageProof>>();
}

}  // namespace lantern
