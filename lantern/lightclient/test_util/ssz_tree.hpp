// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <lantern/lightclient/params/config.hpp>

namespace lantern::test_util {

//! Sparse binary Merkle tree addressed by generalized index, standing in for a beacon container
//! \remarks nodes with no leaf set below them hash to the zero chunk
class SszTree {
  public:
    void set(uint64_t gindex, const cl::Hash32& leaf);

    cl::Hash32 root() const { return node(1); }

    //! Sibling hashes from the leaf at gindex up to the root
    std::vector<cl::Hash32> branch(uint64_t gindex) const;

  private:
    cl::Hash32 node(uint64_t gindex) const;
    bool has_leaf_below(uint64_t gindex) const;

    std::map<uint64_t, cl::Hash32> leaves_;
};

}  // namespace lantern::test_util
