// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "bls.hpp"

#include <blst.h>

namespace lantern::bls {

static bool decode_public_key(blst_p1_affine& out, const PublicKey& public_key) noexcept {
    if (blst_p1_uncompress(&out, public_key.data()) != BLST_SUCCESS) {
        return false;
    }
    return !blst_p1_affine_is_inf(&out) && blst_p1_affine_in_g1(&out);
}

static bool sum_public_keys(blst_p1& sum, std::span<const PublicKey> public_keys) noexcept {
    if (public_keys.empty()) {
        return false;
    }
    for (size_t i{0}; i < public_keys.size(); ++i) {
        blst_p1_affine point;
        if (!decode_public_key(point, public_keys[i])) {
            return false;
        }
        if (i == 0) {
            blst_p1_from_affine(&sum, &point);
        } else {
            blst_p1_add_or_double_affine(&sum, &sum, &point);
        }
    }
    return true;
}

bool is_valid_public_key(const PublicKey& public_key) noexcept {
    blst_p1_affine point;
    return decode_public_key(point, public_key);
}

std::optional<PublicKey> aggregate_public_keys(std::span<const PublicKey> public_keys) noexcept {
    blst_p1 sum;
    if (!sum_public_keys(sum, public_keys)) {
        return std::nullopt;
    }
    PublicKey aggregate;
    blst_p1_compress(aggregate.data(), &sum);
    return aggregate;
}

bool fast_aggregate_verify(std::span<const PublicKey> public_keys, ByteView message,
                           const Signature& signature) noexcept {
    blst_p1 sum;
    if (!sum_public_keys(sum, public_keys)) {
        return false;
    }
    blst_p1_affine aggregate;
    blst_p1_to_affine(&aggregate, &sum);

    blst_p2_affine sig;
    if (blst_p2_uncompress(&sig, signature.data()) != BLST_SUCCESS || !blst_p2_affine_in_g2(&sig)) {
        return false;
    }

    const auto* dst{reinterpret_cast<const byte*>(kDomainSeparationTag.data())};
    const BLST_ERROR result{blst_core_verify_pk_in_g1(&aggregate, &sig, /*hash_or_encode=*/true,
                                                      message.data(), message.size(),
                                                      dst, kDomainSeparationTag.size(), nullptr, 0)};
    return result == BLST_SUCCESS;
}

}  // namespace lantern::bls
