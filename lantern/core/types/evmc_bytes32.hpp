// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/rlp/decode.hpp>

namespace lantern {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

//! \brief Parses a 0x-prefixed (or bare) hex string of exactly 32 bytes
std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex);

}  // namespace lantern

namespace lantern::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace lantern::rlp

namespace evmc {
using lantern::rlp::encode;
using lantern::rlp::length;
}  // namespace evmc
