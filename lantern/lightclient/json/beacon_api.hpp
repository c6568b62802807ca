// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include <lantern/lightclient/types/types.hpp>

// JSON encoding of the light client objects served by the Beacon API (/eth/v1/beacon/light_client/*)
// Numbers are decimal strings, byte vectors are 0x-prefixed hex strings
namespace lantern::cl {

void to_json(nlohmann::json& json, const BeaconBlockHeader& header);
void from_json(const nlohmann::json& json, BeaconBlockHeader& header);

//! Deneb fields are decoded only when present
void to_json(nlohmann::json& json, const ExecutionPayloadHeader& header);
void from_json(const nlohmann::json& json, ExecutionPayloadHeader& header);

void to_json(nlohmann::json& json, const LightClientHeader& header);
void from_json(const nlohmann::json& json, LightClientHeader& header);

void to_json(nlohmann::json& json, const SyncCommittee& committee);
void from_json(const nlohmann::json& json, SyncCommittee& committee);

void to_json(nlohmann::json& json, const SyncAggregate& aggregate);
void from_json(const nlohmann::json& json, SyncAggregate& aggregate);

void to_json(nlohmann::json& json, const LightClientBootstrap& bootstrap);
void from_json(const nlohmann::json& json, LightClientBootstrap& bootstrap);

//! A zeroed next committee or finality branch stands for a missing next committee or finalized header
void to_json(nlohmann::json& json, const LightClientUpdate& update);
void from_json(const nlohmann::json& json, LightClientUpdate& update);

void to_json(nlohmann::json& json, const LightClientFinalityUpdate& update);
void from_json(const nlohmann::json& json, LightClientFinalityUpdate& update);

void to_json(nlohmann::json& json, const LightClientOptimisticUpdate& update);
void from_json(const nlohmann::json& json, LightClientOptimisticUpdate& update);

//! \brief Decodes a Beacon API response body, unwrapping the {"version": .., "data": ..} envelope if any
template <typename T>
T decode_response(const nlohmann::json& json) {
    if (json.is_object() && json.contains("data")) {
        return json.at("data").get<T>();
    }
    return json.get<T>();
}

//! \brief Decodes the response of /eth/v1/beacon/light_client/updates, a list of enveloped updates
std::vector<LightClientUpdate> decode_updates_response(const nlohmann::json& json);

}  // namespace lantern::cl
