// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <limits>

#include "mpz.hpp"
#include "padded_input.hpp"
#include "precompile.hpp"

namespace lantern::precompile {

namespace {

    constexpr uint64_t kHeaderSize{3 * 32};

    // Operand lengths from the 96-byte header: base, exponent and modulus
    struct ModExpHeader {
        intx::uint256 base_len;
        intx::uint256 exp_len;
        intx::uint256 mod_len;

        explicit ModExpHeader(const PaddedInput& input)
            : base_len{input.word(0)}, exp_len{input.word(32)}, mod_len{input.word(64)} {}

        bool fits_u64() const {
            return intx::count_significant_words(base_len) <= 1 && intx::count_significant_words(exp_len) <= 1 &&
                   intx::count_significant_words(mod_len) <= 1;
        }
    };

    intx::uint256 mult_complexity_eip198(const intx::uint256& x) noexcept {
        const intx::uint256 x_squared{x * x};
        if (x <= 64) {
            return x_squared;
        }
        if (x <= 1024) {
            return (x_squared >> 2) + 96 * x - 3072;
        }
        return (x_squared >> 4) + 480 * x - 199680;
    }

    intx::uint256 mult_complexity_eip2565(const intx::uint256& max_length) noexcept {
        const intx::uint256 words{(max_length + 7) >> 3};  // ⌈max_length/8⌉
        return words * words;
    }

    // The first 32 bytes of the exponent as a number
    intx::uint256 exponent_head(const PaddedInput& input, uint64_t base_len, uint64_t exp_len) {
        if (base_len > input.size()) {
            return 0;
        }
        const uint64_t head_len{std::min<uint64_t>(exp_len, 32)};
        const Bytes head{input.slice(kHeaderSize + base_len, head_len)};
        intx::uint256 value{0};
        for (const uint8_t b : head) {
            value = (value << 8) | b;
        }
        return value;
    }

}  // namespace

uint64_t modexp_gas(ByteView data, evmc_revision rev) noexcept {
    const uint64_t min_gas{rev < EVMC_BERLIN ? 0 : 200u};
    const PaddedInput input{data};
    const ModExpHeader header{input};

    if (header.base_len == 0 && header.mod_len == 0) {
        return min_gas;
    }
    if (!header.fits_u64()) {
        return std::numeric_limits<uint64_t>::max();
    }

    const auto base_len{static_cast<uint64_t>(header.base_len)};
    const auto exp_len{static_cast<uint64_t>(header.exp_len)};
    const unsigned bit_len{256 - intx::clz(exponent_head(input, base_len, exp_len))};

    intx::uint256 adjusted_exponent_len{0};
    if (header.exp_len > 32) {
        adjusted_exponent_len = 8 * (header.exp_len - 32);
    }
    if (bit_len > 1) {
        adjusted_exponent_len += bit_len - 1;
    }
    adjusted_exponent_len = std::max(adjusted_exponent_len, intx::uint256{1});

    const intx::uint256 max_length{std::max(header.mod_len, header.base_len)};
    const intx::uint256 gas{rev < EVMC_BERLIN ? mult_complexity_eip198(max_length) * adjusted_exponent_len / 20
                                              : mult_complexity_eip2565(max_length) * adjusted_exponent_len / 3};
    if (intx::count_significant_words(gas) > 1) {
        return std::numeric_limits<uint64_t>::max();
    }
    return std::max(min_gas, static_cast<uint64_t>(gas));
}

Output modexp_run(ByteView data) noexcept {
    const PaddedInput input{data};
    const ModExpHeader header{input};
    // Oversized operands are priced out by modexp_gas
    if (!header.fits_u64()) {
        return std::nullopt;
    }
    const auto base_len{static_cast<uint64_t>(header.base_len)};
    const auto exp_len{static_cast<uint64_t>(header.exp_len)};
    const auto mod_len{static_cast<uint64_t>(header.mod_len)};
    if (mod_len == 0) {
        return Bytes{};
    }

    const Mpz modulus{input.slice(kHeaderSize + base_len + exp_len, mod_len)};
    if (modulus.is_zero()) {
        return Bytes(static_cast<size_t>(mod_len), 0);
    }
    const Mpz base{input.slice(kHeaderSize, base_len)};
    const Mpz exponent{input.slice(kHeaderSize + base_len, exp_len)};

    Mpz result;
    mpz_powm(result.get(), base.get(), exponent.get(), modulus.get());
    return result.to_big_endian(static_cast<size_t>(mod_len));
}

}  // namespace lantern::precompile
