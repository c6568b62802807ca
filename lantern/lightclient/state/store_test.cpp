// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "store.hpp"

#include <array>

#include <catch2/catch_test_macros.hpp>

#include <lantern/lightclient/test_util/mock_beacon_chain.hpp>

namespace lantern::cl {

TEST_CASE("HeaderArena insert", "[lightclient][state]") {
    test_util::MockBeaconChain chain;
    const auto first = chain.make_block(1);
    const auto second = chain.make_block(2);

    HeaderArena arena;
    const auto first_index = arena.insert(first.header);
    const auto second_index = arena.insert(second.header);
    CHECK(first_index != second_index);
    CHECK(arena.insert(first.header) == first_index);
    CHECK(arena.size() == 2);

    CHECK(arena.find(second.root()) == second_index);
    CHECK_FALSE(arena.find(chain.make_block(3).root()));
    CHECK(arena.at(second_index) == second.header);

    const auto* by_number = arena.find_by_block_number(1);
    REQUIRE(by_number);
    CHECK(*by_number == first.header);
    CHECK(arena.find_by_block_number(3) == nullptr);
}

TEST_CASE("HeaderArena find_by_block_number prefers the newest header", "[lightclient][state]") {
    test_util::MockBeaconChain chain;
    auto fork_a = chain.make_block(5);
    auto fork_b = chain.make_block(5);
    REQUIRE(fork_a.root() != fork_b.root());

    HeaderArena arena;
    arena.insert(fork_a.header);
    arena.insert(fork_b.header);
    const auto* found = arena.find_by_block_number(5);
    REQUIRE(found);
    CHECK(*found == fork_b.header);
}

TEST_CASE("HeaderArena prune", "[lightclient][state]") {
    test_util::MockBeaconChain chain;
    HeaderArena arena;
    std::vector<test_util::MockBlock> blocks;
    for (Slot slot{1}; slot <= 10; ++slot) {
        blocks.push_back(chain.make_block(slot));
        arena.insert(blocks.back().header);
    }

    SECTION("nothing to drop") {
        HeaderArena::Index pinned{0};
        const std::array<HeaderArena::Index*, 1> pins{&pinned};
        arena.prune(10, pins);
        CHECK(arena.size() == 10);
        CHECK(pinned == 0);
    }

    SECTION("oldest headers dropped, pinned ones kept") {
        HeaderArena::Index finalized{1};
        HeaderArena::Index optimistic{9};
        const std::array<HeaderArena::Index*, 2> pins{&finalized, &optimistic};
        arena.prune(3, pins);

        CHECK(arena.size() == 4);
        CHECK(arena.at(finalized) == blocks[1].header);
        CHECK(arena.at(optimistic) == blocks[9].header);
        CHECK_FALSE(arena.find(blocks[0].root()));
        CHECK_FALSE(arena.find(blocks[6].root()));
        CHECK(arena.find(blocks[7].root()));
        CHECK(arena.find_by_block_number(3) == nullptr);
        CHECK(arena.find(blocks[1].root()) == finalized);

        // Re-inserting a dropped header appends it again
        const auto index = arena.insert(blocks[0].header);
        CHECK(index == 4);
    }
}

TEST_CASE("LightClientStore equality ignores arena layout", "[lightclient][state]") {
    test_util::MockBeaconChain chain;
    const auto finalized = chain.make_block(8);
    const auto optimistic = chain.make_block(9);
    const auto stale = chain.make_block(7);

    LightClientStore lhs;
    lhs.finalized_index = lhs.headers.insert(finalized.header);
    lhs.optimistic_index = lhs.headers.insert(optimistic.header);
    lhs.current_sync_committee = chain.committee(0);

    LightClientStore rhs;
    rhs.headers.insert(stale.header);
    rhs.optimistic_index = rhs.headers.insert(optimistic.header);
    rhs.finalized_index = rhs.headers.insert(finalized.header);
    rhs.current_sync_committee = chain.committee(0);

    CHECK(lhs == rhs);

    rhs.next_sync_committee = chain.committee(1);
    CHECK_FALSE(lhs == rhs);
}

}  // namespace lantern::cl
