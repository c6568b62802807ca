// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "merkle.hpp"

#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <lantern/core/crypto/sha256.hpp>

namespace lantern::ssz {

using namespace evmc::literals;

TEST_CASE("zero_hash", "[lightclient][ssz]") {
    CHECK(zero_hash(0) == Chunk{});
    CHECK(zero_hash(1) == 0xf5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb4b_bytes32);
    CHECK(zero_hash(2) == 0xdb56114e00fdd4c1f85c892bf35ac9a89289aaecb1ebd0a96cde606a748b5d71_bytes32);
    CHECK(zero_hash(3) == sha256(zero_hash(2), zero_hash(2)));
}

TEST_CASE("to_chunk", "[lightclient][ssz]") {
    CHECK(to_chunk(uint64_t{0x0102}) == 0x0201000000000000000000000000000000000000000000000000000000000000_bytes32);
    CHECK(to_chunk(intx::uint256{1}) == 0x0100000000000000000000000000000000000000000000000000000000000000_bytes32);
    CHECK(to_chunk(0x00000000000000000000000000000000000000ff_address) ==
          0x00000000000000000000000000000000000000ff000000000000000000000000_bytes32);
}

TEST_CASE("merkleize", "[lightclient][ssz]") {
    const Chunk a{0x01_bytes32}, b{0x02_bytes32}, c{0x03_bytes32};

    SECTION("single chunk is its own root") {
        const std::vector<Chunk> chunks{a};
        CHECK(merkleize(chunks) == a);
    }

    SECTION("odd count is padded with zero chunks") {
        const std::vector<Chunk> chunks{a, b, c};
        CHECK(merkleize(chunks) == sha256(sha256(a, b), sha256(c, Chunk{})));
    }

    SECTION("limit extends the tree with zero subtrees") {
        const std::vector<Chunk> chunks{a, b};
        CHECK(merkleize(chunks, 8) == sha256(sha256(sha256(a, b), zero_hash(1)), zero_hash(2)));
    }

    SECTION("empty list with limit") {
        CHECK(merkleize({}, 4) == zero_hash(2));
        CHECK(mix_in_length(merkleize({}, 4), 0) == sha256(zero_hash(2), Chunk{}));
    }
}

TEST_CASE("byte vectors and lists", "[lightclient][ssz]") {
    Bytes pubkey(48, 0xaa);
    const auto chunks = pack(pubkey);
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[1].bytes[15] == 0xaa);
    CHECK(chunks[1].bytes[16] == 0x00);
    CHECK(hash_tree_root(pubkey) == sha256(chunks[0], chunks[1]));

    const Bytes extra_data{0x01, 0x02};
    CHECK(hash_tree_root_byte_list(extra_data, 32) == mix_in_length(pack(extra_data)[0], 2));
}

TEST_CASE("is_valid_merkle_branch", "[lightclient][ssz]") {
    const Chunk a{0x0a_bytes32}, b{0x0b_bytes32}, c{0x0c_bytes32}, d{0x0d_bytes32};
    const std::vector<Chunk> leaves{a, b, c, d};
    const auto root = merkleize(leaves);

    // c is at subtree index 2, generalized index 6
    const std::vector<Chunk> branch{d, sha256(a, b)};
    CHECK(gindex_depth(6) == 2);
    CHECK(gindex_subtree_index(6) == 2);
    CHECK(is_valid_merkle_branch(c, branch, 6, root));
    CHECK_FALSE(is_valid_merkle_branch(d, branch, 6, root));
    CHECK_FALSE(is_valid_merkle_branch(c, branch, 7, root));
    CHECK_FALSE(is_valid_merkle_branch(c, std::vector<Chunk>{d}, 6, root));
}

}  // namespace lantern::ssz
