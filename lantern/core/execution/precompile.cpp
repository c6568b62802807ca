// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "precompile.hpp"

#include <array>
#include <cstring>
#include <limits>

#include <evmone_precompiles/blake2b.hpp>
#include <evmone_precompiles/kzg.hpp>
#include <evmone_precompiles/ripemd160.hpp>
#include <evmone_precompiles/sha256.hpp>

#include <lantern/core/common/endian.hpp>
#include <lantern/core/crypto/ecdsa.hpp>
#include <lantern/core/crypto/secp256k1n.hpp>
#include <lantern/core/protocol/intrinsic_gas.hpp>

#include "padded_input.hpp"

namespace lantern::precompile {

namespace {

    // Linear cost: base + per_word * ⌈size/32⌉
    constexpr uint64_t linear_gas(ByteView input, uint64_t base, uint64_t per_word) noexcept {
        return base + per_word * num_words(input.size());
    }

    Bytes hash_output(const std::byte* digest, size_t size) {
        Bytes out(32, 0);
        std::memcpy(&out[32 - size], digest, size);
        return out;
    }

    const std::byte* as_std_bytes(const uint8_t* p) { return reinterpret_cast<const std::byte*>(p); }

    constexpr size_t kBlake2fInputSize{213};
    constexpr size_t kPointEvaluationInputSize{192};

    // FIELD_ELEMENTS_PER_BLOB and BLS_MODULUS, both as 32-byte big-endian words
    constexpr std::array<uint8_t, 64> kPointEvaluationOutput{
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
        0x73, 0xed, 0xa7, 0x53, 0x29, 0x9d, 0x7d, 0x48, 0x33, 0x39, 0xd8, 0x08, 0x09, 0xa1, 0xd8, 0x05,
        0x53, 0xbd, 0xa4, 0x02, 0xff, 0xfe, 0x5b, 0xfe, 0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x01,
    };

    constexpr Contract kContracts[]{
        {"ECREC", EVMC_FRONTIER, ecrecover_gas, ecrecover_run},                         // 0x01
        {"SHA256", EVMC_FRONTIER, sha256_gas, sha256_run},                              // 0x02
        {"RIPEMD160", EVMC_FRONTIER, ripemd160_gas, ripemd160_run},                     // 0x03
        {"ID", EVMC_FRONTIER, identity_gas, identity_run},                              // 0x04
        {"MODEXP", EVMC_BYZANTIUM, modexp_gas, modexp_run},                             // 0x05
        {"BN254_ADD", EVMC_BYZANTIUM, bn254_add_gas, bn254_add_run},                    // 0x06
        {"BN254_MUL", EVMC_BYZANTIUM, bn254_mul_gas, bn254_mul_run},                    // 0x07
        {"BN254_PAIRING", EVMC_BYZANTIUM, bn254_pairing_gas, bn254_pairing_run},        // 0x08
        {"BLAKE2F", EVMC_ISTANBUL, blake2f_gas, blake2f_run},                           // 0x09
        {"KZG_POINT_EVALUATION", EVMC_CANCUN, point_evaluation_gas, point_evaluation_run},  // 0x0a
    };
    static_assert(std::size(kContracts) == kMaxContractNumber);

}  // namespace

uint64_t ecrecover_gas(ByteView, evmc_revision) noexcept { return 3'000; }

Output ecrecover_run(ByteView data) noexcept {
    const PaddedInput input{data};
    const intx::uint256 v{input.word(32)};
    const intx::uint256 r{input.word(64)};
    const intx::uint256 s{input.word(96)};

    // Unrecoverable signatures give an empty output, not a failure
    if (v != 27 && v != 28) {
        return Bytes{};
    }
    if (!is_valid_signature(r, s, /*homestead=*/false)) {  // EIP-2 does not apply here
        return Bytes{};
    }

    const Bytes padded{input.slice(0, 128)};
    uint8_t message[32];
    std::memcpy(message, &padded[0], sizeof(message));
    uint8_t signature[64];
    std::memcpy(signature, &padded[64], sizeof(signature));

    const std::optional<evmc::address> address{ecdsa::recover_address(message, signature, v == 28 ? 1 : 0)};
    if (!address) {
        return Bytes{};
    }
    Bytes out(32, 0);
    std::memcpy(&out[12], address->bytes, kAddressLength);
    return out;
}

uint64_t sha256_gas(ByteView input, evmc_revision) noexcept { return linear_gas(input, 60, 12); }

Output sha256_run(ByteView input) noexcept {
    std::byte digest[32];
    evmone::crypto::sha256(digest, as_std_bytes(input.data()), input.size());
    return hash_output(digest, sizeof(digest));
}

uint64_t ripemd160_gas(ByteView input, evmc_revision) noexcept { return linear_gas(input, 600, 120); }

Output ripemd160_run(ByteView input) noexcept {
    if (input.size() > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    std::byte digest[20];
    evmone::crypto::ripemd160(digest, as_std_bytes(input.data()), input.size());
    return hash_output(digest, sizeof(digest));
}

uint64_t identity_gas(ByteView input, evmc_revision) noexcept { return linear_gas(input, 15, 3); }

Output identity_run(ByteView input) noexcept { return Bytes{input}; }

uint64_t blake2f_gas(ByteView input, evmc_revision) noexcept {
    // Short input fails in blake2f_run
    if (input.size() < 4) {
        return 0;
    }
    return endian::load_big_u32(input.data());
}

// Input layout: rounds (4, big-endian) | h (64) | m (128) | t (16) | f (1), words of h, m and t little-endian
Output blake2f_run(ByteView input) noexcept {
    if (input.size() != kBlake2fInputSize) {
        return std::nullopt;
    }
    const uint8_t final_block{input[212]};
    if (final_block > 1) {
        return std::nullopt;
    }

    uint64_t h[8];
    for (size_t i{0}; i < std::size(h); ++i) {
        h[i] = endian::load_little_u64(&input[4 + 8 * i]);
    }
    uint64_t m[16];
    for (size_t i{0}; i < std::size(m); ++i) {
        m[i] = endian::load_little_u64(&input[68 + 8 * i]);
    }
    const uint64_t t[2]{endian::load_little_u64(&input[196]), endian::load_little_u64(&input[204])};

    evmone::crypto::blake2b_compress(endian::load_big_u32(input.data()), h, m, t, final_block == 1);

    Bytes out(sizeof(h), 0);
    for (size_t i{0}; i < std::size(h); ++i) {
        endian::store_little_u64(&out[8 * i], h[i]);
    }
    return out;
}

uint64_t point_evaluation_gas(ByteView, evmc_revision) noexcept { return 50'000; }

// Input layout: versioned_hash (32) | z (32) | y (32) | commitment (48) | proof (48)
Output point_evaluation_run(ByteView input) noexcept {
    if (input.size() != kPointEvaluationInputSize) {
        return std::nullopt;
    }
    const bool valid{evmone::crypto::kzg_verify_proof(as_std_bytes(&input[0]), as_std_bytes(&input[32]),
                                                      as_std_bytes(&input[64]), as_std_bytes(&input[96]),
                                                      as_std_bytes(&input[144]))};
    if (!valid) {
        return std::nullopt;
    }
    return Bytes{kPointEvaluationOutput.begin(), kPointEvaluationOutput.end()};
}

const Contract* find(const evmc::address& address, evmc_revision rev) noexcept {
    for (size_t i{0}; i < kAddressLength - 1; ++i) {
        if (address.bytes[i] != 0) {
            return nullptr;
        }
    }
    const uint8_t number{address.bytes[kAddressLength - 1]};
    if (number == 0 || number > kMaxContractNumber) {
        return nullptr;
    }
    const Contract& contract{kContracts[number - 1]};
    return contract.added_in <= rev ? &contract : nullptr;
}

}  // namespace lantern::precompile
