// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"

#include <cstdint>
#include <optional>

#include <evmc/evmc.hpp>
#include <secp256k1.h>

namespace lantern::ecdsa {

inline constexpr unsigned kContextFlags{SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY};

//! \brief The process-wide secp256k1 context used for verification
const secp256k1_context* context() noexcept;

//! \brief Tries to recover the address used for message signing
//! \param [in] message : the signed 32-byte message hash
//! \param [in] signature : the compact signature r || s
//! \param [in] recovery_id : the recovery id (0, 1, 2 or 3)
std::optional<evmc::address> recover_address(const uint8_t (&message)[32], const uint8_t (&signature)[64],
                                             uint8_t recovery_id) noexcept;

//! \brief Address of an uncompressed public key: last 20 bytes of keccak(x || y)
evmc::address public_key_to_address(const secp256k1_pubkey& public_key) noexcept;

}  // namespace lantern::ecdsa
