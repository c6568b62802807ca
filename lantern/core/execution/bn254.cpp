// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

// alt_bn128 (bn254) contracts on top of libff, see
// EIP-196: Precompiled contracts for addition and scalar multiplication on the elliptic curve alt_bn128
// EIP-197: Precompiled contracts for optimal ate pairing check on the elliptic curve alt_bn128

#include <algorithm>
#include <cstring>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <libff/algebra/curves/alt_bn128/alt_bn128_pairing.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>
#pragma GCC diagnostic pop

#include "mpz.hpp"
#include "padded_input.hpp"
#include "precompile.hpp"

namespace lantern::precompile {

namespace {

    using Scalar = libff::bigint<libff::alt_bn128_q_limbs>;
    using G1 = libff::alt_bn128_G1;
    using G2 = libff::alt_bn128_G2;
    using Fq = libff::alt_bn128_Fq;
    using Fq2 = libff::alt_bn128_Fq2;

    constexpr size_t kG1Size{64};
    constexpr size_t kG2Size{128};
    constexpr size_t kPairSize{kG1Size + kG2Size};

    // Thread-safe one-time setup of the curve parameters
    void init_curve() noexcept {
        [[maybe_unused]] static const bool initialized{[]() noexcept {
            libff::inhibit_profiling_info = true;
            libff::inhibit_profiling_counters = true;
            libff::alt_bn128_pp::init_public_params();
            return true;
        }()};
    }

    Scalar to_scalar(const uint8_t* word) {
        const Mpz value{ByteView{word, 32}};
        return Scalar{value.get()};
    }

    // Field elements must be canonical, i.e. below the field modulus (libff's q)
    std::optional<Scalar> to_field_element(const uint8_t* word) {
        Scalar x{to_scalar(word)};
        if (mpn_cmp(x.data, libff::alt_bn128_modulus_q.data, libff::alt_bn128_q_limbs) >= 0) {
            return std::nullopt;
        }
        return x;
    }

    std::optional<G1> decode_g1(const uint8_t* bytes) {
        const auto x{to_field_element(bytes)};
        const auto y{to_field_element(bytes + 32)};
        if (!x || !y) {
            return std::nullopt;
        }
        if (x->is_zero() && y->is_zero()) {
            return G1::zero();
        }
        G1 point{*x, *y, Fq::one()};
        if (!point.is_well_formed()) {
            return std::nullopt;
        }
        return point;
    }

    // Coordinates of G2 points are encoded imaginary part first
    std::optional<Fq2> decode_fq2(const uint8_t* bytes) {
        const auto c1{to_field_element(bytes)};
        const auto c0{to_field_element(bytes + 32)};
        if (!c0 || !c1) {
            return std::nullopt;
        }
        return Fq2{*c0, *c1};
    }

    std::optional<G2> decode_g2(const uint8_t* bytes) {
        const auto x{decode_fq2(bytes)};
        const auto y{decode_fq2(bytes + 64)};
        if (!x || !y) {
            return std::nullopt;
        }
        if (x->is_zero() && y->is_zero()) {
            return G2::zero();
        }
        G2 point{*x, *y, Fq2::one()};
        if (!point.is_well_formed()) {
            return std::nullopt;
        }
        // Points off the prime order subgroup are rejected
        if (!(G2::order() * point).is_zero()) {
            return std::nullopt;
        }
        return point;
    }

    void store_word(uint8_t* out, const Scalar& value) {
        // libff limbs are little-endian
        static_assert(sizeof(value.data) == 32);
        std::memcpy(out, value.data, 32);
        std::reverse(out, out + 32);
    }

    Bytes encode_g1(G1 point) {
        Bytes out(kG1Size, 0);
        if (point.is_zero()) {
            return out;
        }
        point.to_affine_coordinates();
        store_word(&out[0], point.X.as_bigint());
        store_word(&out[32], point.Y.as_bigint());
        return out;
    }

}  // namespace

uint64_t bn254_add_gas(ByteView, evmc_revision rev) noexcept { return rev >= EVMC_ISTANBUL ? 150 : 500; }

Output bn254_add_run(ByteView data) noexcept {
    init_curve();
    const Bytes input{PaddedInput{data}.slice(0, 2 * kG1Size)};
    const auto a{decode_g1(&input[0])};
    const auto b{decode_g1(&input[kG1Size])};
    if (!a || !b) {
        return std::nullopt;
    }
    return encode_g1(*a + *b);
}

uint64_t bn254_mul_gas(ByteView, evmc_revision rev) noexcept { return rev >= EVMC_ISTANBUL ? 6'000 : 40'000; }

Output bn254_mul_run(ByteView data) noexcept {
    init_curve();
    const Bytes input{PaddedInput{data}.slice(0, kG1Size + 32)};
    const auto point{decode_g1(&input[0])};
    if (!point) {
        return std::nullopt;
    }
    return encode_g1(to_scalar(&input[kG1Size]) * *point);
}

uint64_t bn254_pairing_gas(ByteView input, evmc_revision rev) noexcept {
    const uint64_t pairs{input.size() / kPairSize};
    return rev >= EVMC_ISTANBUL ? 34'000 * pairs + 45'000 : 80'000 * pairs + 100'000;
}

Output bn254_pairing_run(ByteView input) noexcept {
    if (input.size() % kPairSize != 0) {
        return std::nullopt;
    }
    init_curve();

    const auto one{libff::alt_bn128_Fq12::one()};
    auto accumulator{one};
    for (size_t offset{0}; offset < input.size(); offset += kPairSize) {
        const auto a{decode_g1(&input[offset])};
        const auto b{decode_g2(&input[offset + kG1Size])};
        if (!a || !b) {
            return std::nullopt;
        }
        if (a->is_zero() || b->is_zero()) {
            continue;
        }
        accumulator = accumulator * libff::alt_bn128_miller_loop(libff::alt_bn128_precompute_G1(*a),
                                                                 libff::alt_bn128_precompute_G2(*b));
    }

    Bytes out(32, 0);
    if (libff::alt_bn128_final_exponentiation(accumulator) == one) {
        out[31] = 1;
    }
    return out;
}

}  // namespace lantern::precompile
