// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <cstring>

#include <ethash/keccak.hpp>
#include <secp256k1_recovery.h>

#include <lantern/core/common/base.hpp>

namespace lantern::ecdsa {

const secp256k1_context* context() noexcept {
    static secp256k1_context* ctx{secp256k1_context_create(kContextFlags)};
    return ctx;
}

evmc::address public_key_to_address(const secp256k1_pubkey& public_key) noexcept {
    uint8_t serialized[65];
    size_t length{sizeof(serialized)};
    secp256k1_ec_pubkey_serialize(context(), serialized, &length, &public_key, SECP256K1_EC_UNCOMPRESSED);

    // Skip the 0x04 tag of the uncompressed form
    const ethash::hash256 hash{ethash::keccak256(serialized + 1, sizeof(serialized) - 1)};
    evmc::address address;
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

std::optional<evmc::address> recover_address(const uint8_t (&message)[32], const uint8_t (&signature)[64],
                                             uint8_t recovery_id) noexcept {
    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context(), &sig, signature, recovery_id)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ecdsa_recover(context(), &public_key, &sig, message)) {
        return std::nullopt;
    }
    return public_key_to_address(public_key);
}

}  // namespace lantern::ecdsa
