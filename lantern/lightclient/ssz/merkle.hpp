// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/common/bytes.hpp>

// SSZ merkleization, see https://github.com/ethereum/consensus-specs/blob/dev/ssz/simple-serialize.md#merkleization
namespace lantern::ssz {

using Chunk = evmc::bytes32;

inline constexpr size_t kBytesPerChunk{32};

//! \brief Root of an all-zero subtree of the given height (height 0 is the zero chunk)
const Chunk& zero_hash(size_t height);

//! \brief Packs a basic uint64 value into its own chunk (little endian, right padded)
Chunk to_chunk(uint64_t value) noexcept;

//! \brief Packs a uint256 value into its chunk (little endian)
Chunk to_chunk(const intx::uint256& value) noexcept;

//! \brief Packs a 20-byte address into its chunk (right padded)
Chunk to_chunk(const evmc::address& address) noexcept;

//! \brief Splits bytes into right padded chunks
std::vector<Chunk> pack(ByteView bytes);

//! \brief Merkle root of the chunks padded with zero chunks up to the next power of two of max(limit, count)
//! \remarks limit is ignored when smaller than the chunk count
Chunk merkleize(std::span<const Chunk> chunks, size_t limit = 0);

//! \brief Root of a list: its content root mixed in with its length
Chunk mix_in_length(const Chunk& root, uint64_t length) noexcept;

//! \brief Root of a fixed size byte vector, e.g. Bytes48 or ByteVector[256]
Chunk hash_tree_root(ByteView fixed_bytes);

//! \brief Root of a ByteList[max_size]
Chunk hash_tree_root_byte_list(ByteView bytes, size_t max_size);

//! \brief Depth of a generalized index, i.e. the length of its Merkle branch
constexpr size_t gindex_depth(uint64_t gindex) noexcept {
    size_t depth{0};
    while (gindex > 1) {
        gindex >>= 1;
        ++depth;
    }
    return depth;
}

//! \brief Position of a generalized index among the nodes of its depth
constexpr uint64_t gindex_subtree_index(uint64_t gindex) noexcept {
    return gindex - (uint64_t{1} << gindex_depth(gindex));
}

//! \brief Checks that leaf is at position index of a tree of the given depth whose root is root
bool is_valid_merkle_branch(const Chunk& leaf, std::span<const Chunk> branch, size_t depth, uint64_t index,
                            const Chunk& root) noexcept;

//! \brief Checks that leaf is at generalized index gindex of the tree rooted at root
inline bool is_valid_merkle_branch(const Chunk& leaf, std::span<const Chunk> branch, uint64_t gindex,
                                   const Chunk& root) noexcept {
    return is_valid_merkle_branch(leaf, branch, gindex_depth(gindex), gindex_subtree_index(gindex), root);
}

}  // namespace lantern::ssz
