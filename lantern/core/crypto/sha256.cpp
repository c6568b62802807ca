// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha256.hpp"

#include <cstring>

#include <evmone_precompiles/sha256.hpp>

namespace lantern {

evmc::bytes32 sha256(ByteView data) noexcept {
    evmc::bytes32 digest;
    evmone::crypto::sha256(reinterpret_cast<std::byte*>(digest.bytes),
                           reinterpret_cast<const std::byte*>(data.data()),
                           data.size());
    return digest;
}

evmc::bytes32 sha256(const evmc::bytes32& left, const evmc::bytes32& right) noexcept {
    uint8_t buffer[64];
    std::memcpy(buffer, left.bytes, 32);
    std::memcpy(buffer + 32, right.bytes, 32);
    return sha256(ByteView{buffer});
}

}  // namespace lantern
