// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "bls_signer.hpp"

#include <stdexcept>

#include <lantern/core/common/endian.hpp>

namespace lantern::test_util {

BlsSigner::BlsSigner(uint64_t seed) {
    uint8_t ikm[32]{};
    for (size_t i{0}; i < sizeof(ikm); ++i) {
        ikm[i] = static_cast<uint8_t>(0xA5 ^ i);
    }
    endian::store_big_u64(ikm + 24, seed);
    blst_keygen(&secret_key_, ikm, sizeof(ikm), nullptr, 0);

    blst_p1 public_key;
    blst_sk_to_pk_in_g1(&public_key, &secret_key_);
    blst_p1_compress(public_key_.data(), &public_key);
}

bls::Signature BlsSigner::sign(ByteView message) const {
    const auto* dst{reinterpret_cast<const byte*>(bls::kDomainSeparationTag.data())};
    blst_p2 hash;
    blst_hash_to_g2(&hash, message.data(), message.size(), dst, bls::kDomainSeparationTag.size(), nullptr, 0);
    blst_p2 signature;
    blst_sign_pk_in_g1(&signature, &hash, &secret_key_);

    bls::Signature out;
    blst_p2_compress(out.data(), &signature);
    return out;
}

bls::Signature aggregate_signatures(std::span<const bls::Signature> signatures) {
    if (signatures.empty()) {
        throw std::invalid_argument{"no signature to aggregate"};
    }
    blst_p2 sum;
    for (size_t i{0}; i < signatures.size(); ++i) {
        blst_p2_affine point;
        if (blst_p2_uncompress(&point, signatures[i].data()) != BLST_SUCCESS) {
            throw std::invalid_argument{"invalid signature encoding"};
        }
        if (i == 0) {
            blst_p2_from_affine(&sum, &point);
        } else {
            blst_p2_add_or_double_affine(&sum, &sum, &point);
        }
    }
    bls::Signature out;
    blst_p2_compress(out.data(), &sum);
    return out;
}

}  // namespace lantern::test_util
