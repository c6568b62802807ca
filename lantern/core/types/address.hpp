// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>

namespace lantern {

// Yellow Paper, Section 7
evmc::address create_address(const evmc::address& caller, uint64_t nonce) noexcept;

// https://eips.ethereum.org/EIPS/eip-1014
evmc::address create2_address(const evmc::address& caller, const evmc::bytes32& salt,
                              const uint8_t (&code_hash)[32]) noexcept;

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

//! \brief Parses a hex string of exactly 20 bytes, std::nullopt otherwise
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

}  // namespace lantern

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);
std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value);

}  // namespace evmc
