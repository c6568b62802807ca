// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include <lantern/core/types/call_request.hpp>

namespace lantern {

void to_json(nlohmann::json& json, const AccessListEntry& entry);
void from_json(const nlohmann::json& json, AccessListEntry& entry);

//! Transaction call object of eth_call, eth_estimateGas and eth_createAccessList
void to_json(nlohmann::json& json, const CallRequest& request);
void from_json(const nlohmann::json& json, CallRequest& request);

}  // namespace lantern
