// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <lantern/core/common/bytes.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

//! Accepts both 0x-prefixed quantities and decimal strings
void from_json(const nlohmann::json& json, uint256& ui256);

}  // namespace intx

namespace lantern::rpc {

//! \brief Parses a 0x-prefixed hex quantity
//! \throws std::system_error if the string is not a valid 64-bit quantity
uint64_t from_quantity(const std::string& hex_quantity);

//! \brief Parses a 64-bit unsigned integer encoded as a decimal string, as in the Beacon API
uint64_t from_decimal(const std::string& decimal);

std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);

//! \brief Decodes a JSON hex string into bytes
//! \throws std::system_error if the string is not valid hex
Bytes bytes_from_json(const nlohmann::json& json);

std::string bytes_to_json(ByteView bytes);

}  // namespace lantern::rpc
