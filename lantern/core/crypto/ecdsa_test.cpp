// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <catch2/catch_test_macros.hpp>
#include <secp256k1_recovery.h>

#include <lantern/core/common/util.hpp>
#include <lantern/core/crypto/secp256k1n.hpp>
#include <lantern/core/crypto/sha256.hpp>

namespace lantern {

using namespace evmc::literals;

TEST_CASE("Recover signer address", "[core][crypto]") {
    const auto* ctx{ecdsa::context()};
    const Bytes secret{*from_hex("0x4646464646464646464646464646464646464646464646464646464646464646")};
    secp256k1_pubkey public_key;
    REQUIRE(secp256k1_ec_pubkey_create(ctx, &public_key, secret.data()));
    // Address of the EIP-155 example private key
    CHECK(ecdsa::public_key_to_address(public_key) == 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address);

    const ethash::hash256 message{keccak256(*from_hex("0xdeadbeef"))};
    secp256k1_ecdsa_recoverable_signature signature;
    REQUIRE(secp256k1_ecdsa_sign_recoverable(ctx, &signature, message.bytes, secret.data(), nullptr, nullptr));
    uint8_t compact[64];
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, compact, &recovery_id, &signature);

    const auto recovered{ecdsa::recover_address(message.bytes, compact, static_cast<uint8_t>(recovery_id))};
    REQUIRE(recovered);
    CHECK(*recovered == 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address);

    const auto wrong{ecdsa::recover_address(message.bytes, compact, static_cast<uint8_t>(recovery_id ^ 1))};
    CHECK((!wrong || *wrong != 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address));

    CHECK_FALSE(ecdsa::recover_address(message.bytes, compact, 4));
}

TEST_CASE("Signature value ranges", "[core][crypto]") {
    CHECK_FALSE(is_valid_signature(0, 1, false));
    CHECK_FALSE(is_valid_signature(1, kSecp256k1n, false));
    CHECK(is_valid_signature(1, kSecp256k1Halfn + 1, false));
    CHECK_FALSE(is_valid_signature(1, kSecp256k1Halfn + 1, true));
}

TEST_CASE("SHA-256", "[core][crypto]") {
    const Bytes abc{'a', 'b', 'c'};
    CHECK(sha256(abc) == 0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad_bytes32);
    CHECK(sha256(Bytes{}) == 0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855_bytes32);
    // Root of a two-chunk zero tree
    CHECK(sha256(evmc::bytes32{}, evmc::bytes32{}) ==
          0xf5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb4b_bytes32);
}

}  // namespace lantern
