// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <span>

#include <blst.h>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/crypto/bls.hpp>

namespace lantern::test_util {

//! Deterministic BLS secret key for producing sync committee signatures in tests
class BlsSigner {
  public:
    explicit BlsSigner(uint64_t seed);

    const bls::PublicKey& public_key() const { return public_key_; }

    bls::Signature sign(ByteView message) const;

  private:
    blst_scalar secret_key_{};
    bls::PublicKey public_key_{};
};

//! Sum of G2 signatures, all signing the same message
bls::Signature aggregate_signatures(std::span<const bls::Signature> signatures);

}  // namespace lantern::test_util
