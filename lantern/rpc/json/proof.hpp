// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <lantern/core/types/account_proof.hpp>

namespace lantern {

//! eth_getProof response, see EIP-1186
void to_json(nlohmann::json& json, const AccountProof& proof);
void from_json(const nlohmann::json& json, AccountProof& proof);

void to_json(nlohmann::json& json, const StorageProof& proof);
void from_json(const nlohmann::json& json, StorageProof& proof);

}  // namespace lantern
