// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>

// See Yellow Paper, Appendix E "Precompiled Contracts"
namespace lantern::precompile {

//! Output of a precompiled contract; std::nullopt when the input is invalid, which fails the call
using Output = std::optional<Bytes>;

using GasFunction = uint64_t (*)(ByteView input, evmc_revision) noexcept;
using RunFunction = Output (*)(ByteView input) noexcept;

struct Contract {
    std::string_view name;
    evmc_revision added_in;
    GasFunction gas;
    RunFunction run;
};

uint64_t ecrecover_gas(ByteView input, evmc_revision) noexcept;
Output ecrecover_run(ByteView input) noexcept;

uint64_t sha256_gas(ByteView input, evmc_revision) noexcept;
Output sha256_run(ByteView input) noexcept;

uint64_t ripemd160_gas(ByteView input, evmc_revision) noexcept;
Output ripemd160_run(ByteView input) noexcept;

uint64_t identity_gas(ByteView input, evmc_revision) noexcept;
Output identity_run(ByteView input) noexcept;

// EIP-198: Big integer modular exponentiation, repriced by EIP-2565
uint64_t modexp_gas(ByteView input, evmc_revision) noexcept;
Output modexp_run(ByteView input) noexcept;

// EIP-196: Precompiled contracts for addition and scalar multiplication on the elliptic curve alt_bn128
uint64_t bn254_add_gas(ByteView input, evmc_revision) noexcept;
Output bn254_add_run(ByteView input) noexcept;
uint64_t bn254_mul_gas(ByteView input, evmc_revision) noexcept;
Output bn254_mul_run(ByteView input) noexcept;

// EIP-197: Precompiled contracts for optimal ate pairing check on the elliptic curve alt_bn128
uint64_t bn254_pairing_gas(ByteView input, evmc_revision) noexcept;
Output bn254_pairing_run(ByteView input) noexcept;

// EIP-152: Add BLAKE2 compression function `F` precompile
uint64_t blake2f_gas(ByteView input, evmc_revision) noexcept;
Output blake2f_run(ByteView input) noexcept;

// EIP-4844: Shard Blob Transactions
uint64_t point_evaluation_gas(ByteView input, evmc_revision) noexcept;
Output point_evaluation_run(ByteView input) noexcept;

//! The contract deployed at address under revision, nullptr if there is none
const Contract* find(const evmc::address& address, evmc_revision rev) noexcept;

inline bool is_precompile(const evmc::address& address, evmc_revision rev) noexcept {
    return find(address, rev) != nullptr;
}

//! Addresses 0x01..0x0a, for warming up at the start of a call (EIP-2929)
inline constexpr uint8_t kMaxContractNumber{0x0a};

}  // namespace lantern::precompile
