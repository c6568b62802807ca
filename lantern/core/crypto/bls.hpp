// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include <lantern/core/common/bytes.hpp>

// BLS signatures over BLS12-381 as used by the beacon chain: public keys in G1, signatures in G2,
// proof-of-possession ciphersuite (see https://datatracker.ietf.org/doc/draft-irtf-cfrg-bls-signature/)
namespace lantern::bls {

inline constexpr size_t kPublicKeySize{48};
inline constexpr size_t kSignatureSize{96};

inline constexpr std::string_view kDomainSeparationTag{"BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_POP_"};

using PublicKey = std::array<uint8_t, kPublicKeySize>;
using Signature = std::array<uint8_t, kSignatureSize>;

//! \brief Checks that a compressed public key decodes to a valid non-identity point of the G1 subgroup
bool is_valid_public_key(const PublicKey& public_key) noexcept;

//! \brief Sums the public keys into their aggregate public key
//! \return std::nullopt if the list is empty or any key is invalid
std::optional<PublicKey> aggregate_public_keys(std::span<const PublicKey> public_keys) noexcept;

//! \brief Verifies that all public keys signed the same message, checking one pairing against their sum
//! \return false if the list is empty, any key or the signature is invalid, or the pairing check fails
bool fast_aggregate_verify(std::span<const PublicKey> public_keys, ByteView message,
                           const Signature& signature) noexcept;

}  // namespace lantern::bls
