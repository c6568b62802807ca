// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "ssz_tree.hpp"

#include <lantern/core/crypto/sha256.hpp>

namespace lantern::test_util {

void SszTree::set(uint64_t gindex, const cl::Hash32& leaf) {
    leaves_[gindex] = leaf;
}

std::vector<cl::Hash32> SszTree::branch(uint64_t gindex) const {
    std::vector<cl::Hash32> siblings;
    for (; gindex > 1; gindex >>= 1) {
        siblings.push_back(node(gindex ^ 1));
    }
    return siblings;
}

cl::Hash32 SszTree::node(uint64_t gindex) const {
    if (const auto it{leaves_.find(gindex)}; it != leaves_.end()) {
        return it->second;
    }
    if (!has_leaf_below(gindex)) {
        return cl::Hash32{};
    }
    return sha256(node(2 * gindex), node(2 * gindex + 1));
}

bool SszTree::has_leaf_below(uint64_t gindex) const {
    for (const auto& [leaf_gindex, _] : leaves_) {
        for (uint64_t ancestor{leaf_gindex >> 1}; ancestor >= gindex && ancestor > 0; ancestor >>= 1) {
            if (ancestor == gindex) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace lantern::test_util
