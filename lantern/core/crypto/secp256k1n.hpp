// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"
// and EIP-2: Homestead Hard-fork Changes.

#include <intx/intx.hpp>

namespace lantern {

inline constexpr intx::uint256 kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};

inline constexpr intx::uint256 kSecp256k1Halfn{kSecp256k1n >> 1};

//! Verifies whether the signature values are in range, optionally enforcing the EIP-2 low s
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s, bool homestead) noexcept;

}  // namespace lantern
