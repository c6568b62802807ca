// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <string_view>
#include <system_error>
#include <utility>

#include <absl/strings/numbers.h>

#include <lantern/core/common/util.hpp>
#include <lantern/core/types/address.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = lantern::address_to_hex(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    const auto parsed = lantern::hex_to_address(json.get<std::string>());
    if (!parsed) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid address: " + json.dump()};
    }
    addr = *parsed;
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = lantern::to_hex(b32, true);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto parsed = lantern::hex_to_bytes32(json.get<std::string>());
    if (!parsed) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid bytes32: " + json.dump()};
    }
    b32 = *parsed;
}

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    try {
        ui256 = intx::from_string<intx::uint256>(json.get<std::string>());
    } catch (const std::exception& e) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                                "invalid uint256: " + json.dump() + " (" + e.what() + ")"};
    }
}

}  // namespace intx

namespace lantern::rpc {

uint64_t from_quantity(const std::string& hex_quantity) {
    uint64_t number{0};
    if (!has_hex_prefix(hex_quantity) || !absl::SimpleHexAtoi(std::string_view{hex_quantity}.substr(2), &number)) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid quantity: " + hex_quantity};
    }
    return number;
}

uint64_t from_decimal(const std::string& decimal) {
    uint64_t number{0};
    if (!absl::SimpleAtoi(decimal, &number)) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid number: " + decimal};
    }
    return number;
}

std::string to_quantity(uint64_t number) {
    return to_quantity(intx::uint256{number});
}

std::string to_quantity(const intx::uint256& number) {
    return "0x" + intx::hex(number);
}

Bytes bytes_from_json(const nlohmann::json& json) {
    auto bytes = from_hex(json.get<std::string>());
    if (!bytes) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid hex: " + json.dump()};
    }
    return std::move(*bytes);
}

std::string bytes_to_json(ByteView bytes) {
    return to_hex(bytes, /*with_prefix=*/true);
}

}  // namespace lantern::rpc
