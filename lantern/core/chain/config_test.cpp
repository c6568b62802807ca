// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <catch2/catch_test_macros.hpp>

namespace lantern {

TEST_CASE("Mainnet revisions") {
    CHECK(kMainnetConfig.revision(0, 0) == EVMC_FRONTIER);
    CHECK(kMainnetConfig.revision(1'150'000, 0) == EVMC_HOMESTEAD);
    CHECK(kMainnetConfig.revision(12'965'000, 0) == EVMC_LONDON);
    CHECK(kMainnetConfig.revision(15'537'394, 1663224162) == EVMC_PARIS);
    CHECK(kMainnetConfig.revision(17'034'870, 1681338455) == EVMC_SHANGHAI);
    CHECK(kMainnetConfig.revision(19'426'587, 1710338135) == EVMC_CANCUN);
    CHECK(kMainnetConfig.revision(22'431'084, 1746612311) == EVMC_PRAGUE);
}

TEST_CASE("Sepolia revisions") {
    CHECK(kSepoliaConfig.revision(0, 0) == EVMC_LONDON);
    CHECK(kSepoliaConfig.revision(1'735'371, 1661000000) == EVMC_PARIS);
    CHECK(kSepoliaConfig.revision(5'187'023, 1706655072) == EVMC_CANCUN);
}

TEST_CASE("ChainConfig JSON") {
    SECTION("round trip of known chains") {
        for (const auto* config : {&kMainnetConfig, &kHoleskyConfig, &kSepoliaConfig}) {
            const auto parsed{ChainConfig::from_json(config->to_json())};
            REQUIRE(parsed);
            CHECK(*parsed == *config);
        }
    }

    SECTION("geth genesis config") {
        const auto json = nlohmann::json::parse(R"({
            "chainId": 1337,
            "homesteadBlock": 0,
            "eip150Block": 0,
            "eip155Block": 0,
            "byzantiumBlock": 0,
            "constantinopleBlock": 0,
            "petersburgBlock": 0,
            "istanbulBlock": 0,
            "berlinBlock": 0,
            "londonBlock": 0,
            "terminalTotalDifficulty": 0,
            "shanghaiTime": 0,
            "cancunTime": 100
        })");
        const auto config{ChainConfig::from_json(json)};
        REQUIRE(config);
        CHECK(config->chain_id == 1337);
        CHECK(config->terminal_total_difficulty == intx::uint256{0});
        CHECK(config->revision(10, 99) == EVMC_SHANGHAI);
        CHECK(config->revision(11, 100) == EVMC_CANCUN);
    }

    SECTION("invalid") {
        CHECK_FALSE(ChainConfig::from_json(nlohmann::json::parse(R"({"homesteadBlock": 0})")));
        CHECK_FALSE(ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": 1, "londonBlock": "x"})")));
        CHECK_FALSE(ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": 1, "terminalTotalDifficulty": "0xz"})")));
    }
}

TEST_CASE("Known chains lookup") {
    const auto sepolia{lookup_known_chain("Sepolia")};
    REQUIRE(sepolia);
    CHECK(sepolia->second == &kSepoliaConfig);

    const auto holesky{lookup_known_chain(ChainId{17000})};
    REQUIRE(holesky);
    CHECK(holesky->first == "holesky");

    CHECK_FALSE(lookup_known_chain("goerli"));
    CHECK_FALSE(lookup_known_chain(ChainId{5}));
}

}  // namespace lantern
