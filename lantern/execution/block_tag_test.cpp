// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_tag.hpp"

#include <catch2/catch_test_macros.hpp>

#include <lantern/execution/errors.hpp>

namespace lantern::execution {

static cl::LightClientHeader header_at(BlockNum block_number) {
    cl::LightClientHeader header;
    header.beacon.slot = block_number + 1000;
    header.execution.block_number = block_number;
    return header;
}

TEST_CASE("parse_block_tag", "[execution][block_tag]") {
    CHECK(parse_block_tag("latest") == BlockTag{NamedBlock::kLatest});
    CHECK(parse_block_tag("Safe") == BlockTag{NamedBlock::kSafe});
    CHECK(parse_block_tag("finalized") == BlockTag{NamedBlock::kFinalized});
    CHECK(parse_block_tag("0x10") == BlockTag{BlockNum{16}});
    CHECK(parse_block_tag("0X1a") == BlockTag{BlockNum{26}});
    CHECK(parse_block_tag("19500000") == BlockTag{BlockNum{19'500'000}});

    CHECK_FALSE(parse_block_tag("pending"));
    CHECK_FALSE(parse_block_tag("earliest"));
    CHECK_FALSE(parse_block_tag("0x"));
    CHECK_FALSE(parse_block_tag("0xzz"));
    CHECK_FALSE(parse_block_tag("-1"));
    CHECK_FALSE(parse_block_tag(""));
}

TEST_CASE("to_string(BlockTag)", "[execution][block_tag]") {
    CHECK(to_string(BlockTag{NamedBlock::kLatest}) == "latest");
    CHECK(to_string(BlockTag{NamedBlock::kSafe}) == "safe");
    CHECK(to_string(BlockTag{NamedBlock::kFinalized}) == "finalized");
    CHECK(to_string(BlockTag{BlockNum{42}}) == "42");
}

TEST_CASE("resolve_block_tag", "[execution][block_tag]") {
    cl::HeadSnapshot snapshot{
        .version = 3,
        .state = cl::SyncState::kOptimistic,
        .finalized = header_at(64),
        .optimistic = header_at(90),
        .history = {header_at(64), header_at(72), header_at(90)},
    };

    SECTION("default policy") {
        const BlockTagPolicy policy;
        CHECK(resolve_block_tag(&snapshot, NamedBlock::kLatest, policy).execution.block_number == 90);
        CHECK(resolve_block_tag(&snapshot, NamedBlock::kSafe, policy).execution.block_number == 64);
        CHECK(resolve_block_tag(&snapshot, NamedBlock::kFinalized, policy).execution.block_number == 64);
        CHECK(resolve_block_tag(&snapshot, BlockNum{72}, policy).execution.block_number == 72);
    }

    SECTION("finalized only") {
        const BlockTagPolicy policy{.latest = HeadSource::kFinalized, .safe = HeadSource::kFinalized};
        CHECK(resolve_block_tag(&snapshot, NamedBlock::kLatest, policy).execution.block_number == 64);
    }

    SECTION("optimistic safe head") {
        const BlockTagPolicy policy{.safe = HeadSource::kOptimistic};
        CHECK(resolve_block_tag(&snapshot, NamedBlock::kSafe, policy).execution.block_number == 90);
    }

    SECTION("unknown block") {
        try {
            (void)resolve_block_tag(&snapshot, BlockNum{73}, {});
            FAIL("block 73 resolved");
        } catch (const ExecutionError& e) {
            CHECK(e.code() == ExecutionErrorCode::kBlockNotAvailable);
        }
    }

    SECTION("no head yet") {
        try {
            (void)resolve_block_tag(nullptr, NamedBlock::kLatest, {});
            FAIL("resolved without head");
        } catch (const ExecutionError& e) {
            CHECK(e.code() == ExecutionErrorCode::kHeaderNotSynced);
        }
    }
}

}  // namespace lantern::execution
