// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "call.hpp"

#include <lantern/rpc/json/types.hpp>

namespace lantern {

void to_json(nlohmann::json& json, const AccessListEntry& entry) {
    json["address"] = entry.account;
    json["storageKeys"] = entry.storage_keys;
}

void from_json(const nlohmann::json& json, AccessListEntry& entry) {
    entry.account = json.at("address").get<evmc::address>();
    entry.storage_keys = json.at("storageKeys").get<std::vector<evmc::bytes32>>();
}

void to_json(nlohmann::json& json, const CallRequest& request) {
    json = nlohmann::json::object();
    if (request.from) {
        json["from"] = *request.from;
    }
    if (request.to) {
        json["to"] = *request.to;
    }
    if (request.gas) {
        json["gas"] = rpc::to_quantity(*request.gas);
    }
    if (request.gas_price != 0) {
        json["gasPrice"] = rpc::to_quantity(request.gas_price);
    }
    if (request.value != 0) {
        json["value"] = rpc::to_quantity(request.value);
    }
    if (!request.data.empty()) {
        json["input"] = rpc::bytes_to_json(request.data);
    }
    if (!request.access_list.empty()) {
        json["accessList"] = request.access_list;
    }
}

void from_json(const nlohmann::json& json, CallRequest& request) {
    if (json.contains("from") && !json["from"].is_null()) {
        request.from = json["from"].get<evmc::address>();
    }
    if (json.contains("to") && !json["to"].is_null()) {
        request.to = json["to"].get<evmc::address>();
    }
    if (json.contains("gas")) {
        request.gas = rpc::from_quantity(json["gas"].get<std::string>());
    }
    if (json.contains("gasPrice")) {
        request.gas_price = json["gasPrice"].get<intx::uint256>();
    }
    if (json.contains("value")) {
        request.value = json["value"].get<intx::uint256>();
    }
    // "input" takes precedence over the legacy "data" field
    if (json.contains("input")) {
        request.data = rpc::bytes_from_json(json["input"]);
    } else if (json.contains("data")) {
        request.data = rpc::bytes_from_json(json["data"]);
    }
    if (json.contains("accessList")) {
        request.access_list = json["accessList"].get<std::vector<AccessListEntry>>();
    }
}

}  // namespace lantern
