// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "merkle.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstring>

#include <lantern/core/common/endian.hpp>
#include <lantern/core/crypto/sha256.hpp>

namespace lantern::ssz {

// Enough for any list limit we merkleize (2^40 chunks)
static constexpr size_t kMaxTreeHeight{41};

static std::array<Chunk, kMaxTreeHeight> make_zero_hashes() {
    std::array<Chunk, kMaxTreeHeight> hashes{};
    for (size_t i{1}; i < kMaxTreeHeight; ++i) {
        hashes[i] = sha256(hashes[i - 1], hashes[i - 1]);
    }
    return hashes;
}

const Chunk& zero_hash(size_t height) {
    static const std::array<Chunk, kMaxTreeHeight> kZeroHashes{make_zero_hashes()};
    return kZeroHashes.at(height);
}

Chunk to_chunk(uint64_t value) noexcept {
    Chunk chunk{};
    endian::store_little_u64(chunk.bytes, value);
    return chunk;
}

Chunk to_chunk(const intx::uint256& value) noexcept {
    Chunk chunk{};
    intx::le::store(chunk.bytes, value);
    return chunk;
}

Chunk to_chunk(const evmc::address& address) noexcept {
    Chunk chunk{};
    std::memcpy(chunk.bytes, address.bytes, sizeof(address.bytes));
    return chunk;
}

std::vector<Chunk> pack(ByteView bytes) {
    std::vector<Chunk> chunks((bytes.size() + kBytesPerChunk - 1) / kBytesPerChunk);
    for (size_t i{0}; i < chunks.size(); ++i) {
        const auto part = bytes.substr(i * kBytesPerChunk, kBytesPerChunk);
        std::memcpy(chunks[i].bytes, part.data(), part.size());
    }
    return chunks;
}

Chunk merkleize(std::span<const Chunk> chunks, size_t limit) {
    const size_t leaf_count{std::bit_ceil(std::max<size_t>({limit, chunks.size(), 1}))};
    const size_t height{static_cast<size_t>(std::countr_zero(leaf_count))};
    if (chunks.empty()) {
        return zero_hash(height);
    }

    // Hash level by level; missing right siblings are zero subtrees of the current level height
    std::vector<Chunk> level{chunks.begin(), chunks.end()};
    for (size_t h{0}; h < height; ++h) {
        std::vector<Chunk> parents((level.size() + 1) / 2);
        for (size_t i{0}; i < parents.size(); ++i) {
            const Chunk& left{level[2 * i]};
            const Chunk& right{2 * i + 1 < level.size() ? level[2 * i + 1] : zero_hash(h)};
            parents[i] = sha256(left, right);
        }
        level = std::move(parents);
    }
    return level.front();
}

Chunk mix_in_length(const Chunk& root, uint64_t length) noexcept {
    return sha256(root, to_chunk(length));
}

Chunk hash_tree_root(ByteView fixed_bytes) {
    const auto chunks = pack(fixed_bytes);
    return merkleize(chunks);
}

Chunk hash_tree_root_byte_list(ByteView bytes, size_t max_size) {
    const auto chunks = pack(bytes);
    const size_t chunk_limit{(max_size + kBytesPerChunk - 1) / kBytesPerChunk};
    return mix_in_length(merkleize(chunks, chunk_limit), bytes.size());
}

bool is_valid_merkle_branch(const Chunk& leaf, std::span<const Chunk> branch, size_t depth, uint64_t index,
                            const Chunk& root) noexcept {
    if (branch.size() != depth) {
        return false;
    }
    Chunk value{leaf};
    for (size_t i{0}; i < depth; ++i) {
        if ((index >> i) & 1) {
            value = sha256(branch[i], value);
        } else {
            value = sha256(value, branch[i]);
        }
    }
    return value == root;
}

}  // namespace lantern::ssz
