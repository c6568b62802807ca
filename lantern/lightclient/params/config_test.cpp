// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

namespace lantern::cl {

TEST_CASE("BeaconChainConfig forks", "[lightclient][params]") {
    const auto& bcc = kMainnetBeaconConfig;
    CHECK(bcc.fork_at_epoch(0) == Fork::kGenesis);
    CHECK(bcc.fork_at_epoch(74240) == Fork::kAltair);
    CHECK(bcc.fork_at_epoch(194047) == Fork::kBellatrix);
    CHECK(bcc.fork_at_epoch(194048) == Fork::kCapella);
    CHECK(bcc.fork_at_epoch(300000) == Fork::kDeneb);
    CHECK(bcc.fork_at_epoch(364032) == Fork::kElectra);
    CHECK(bcc.fork_version_at_epoch(269568) == ForkVersion{0x04, 0x00, 0x00, 0x00});
    CHECK(bcc.fork_at_slot(194048 * 32) == Fork::kCapella);

    CHECK(kMinimalBeaconConfig.fork_at_epoch(0) == Fork::kDeneb);
}

TEST_CASE("BeaconChainConfig periods", "[lightclient][params]") {
    CHECK(kMainnetBeaconConfig.slots_per_sync_committee_period() == 8192);
    CHECK(kMainnetBeaconConfig.sync_committee_period(8191) == 0);
    CHECK(kMainnetBeaconConfig.sync_committee_period(8192) == 1);
    CHECK(kMinimalBeaconConfig.slots_per_sync_committee_period() == 64);
    CHECK(kMinimalBeaconConfig.sync_committee_period(130) == 2);
}

TEST_CASE("lookup_consensus_config", "[lightclient][params]") {
    CHECK(lookup_consensus_config("Mainnet") == &mainnet_consensus_config());
    CHECK(lookup_consensus_config("sepolia") == &sepolia_consensus_config());
    CHECK(lookup_consensus_config(kHoleskyConfig.chain_id) == &holesky_consensus_config());
    CHECK(lookup_consensus_config("goerli") == nullptr);
    CHECK(lookup_consensus_config(ChainId{1337}) == nullptr);
    CHECK(mainnet_consensus_config().chain_config == kMainnetConfig);
}

TEST_CASE("ConsensusConfig::from_json", "[lightclient][params]") {
    SECTION("custom network on top of the mainnet preset") {
        const auto json = nlohmann::json::parse(R"({
            "genesis_validators_root": "0x4b363db94e286120d76eb905340fdd4e54bfe9f06bf33ff6cf5ad27f511bfe95",
            "genesis_time": "1606824023",
            "beacon": {
                "SLOTS_PER_EPOCH": 8,
                "EPOCHS_PER_SYNC_COMMITTEE_PERIOD": "8",
                "SYNC_COMMITTEE_SIZE": 32,
                "CAPELLA_FORK_VERSION": "0x03000001",
                "CAPELLA_FORK_EPOCH": 0
            },
            "execution": {"chainId": 1337, "londonBlock": 0, "shanghaiTime": 0}
        })");
        const auto config = ConsensusConfig::from_json(json);
        REQUIRE(config);
        CHECK(config->genesis_config == kMainnetGenesisConfig);
        CHECK(config->beacon_chain_config.slots_per_epoch == 8);
        CHECK(config->beacon_chain_config.sync_committee_size == 32);
        CHECK(config->beacon_chain_config.capella_fork_version == ForkVersion{0x03, 0x00, 0x00, 0x01});
        CHECK(config->beacon_chain_config.capella_fork_epoch == 0);
        CHECK(config->beacon_chain_config.deneb_fork_epoch == kMainnetBeaconConfig.deneb_fork_epoch);
        CHECK(config->chain_config.chain_id == 1337);
    }

    SECTION("invalid documents") {
        const std::string root{R"("genesis_validators_root": "0x4b363db94e286120d76eb905340fdd4e54bfe9f06bf33ff6cf5ad27f511bfe95")"};
        CHECK_FALSE(ConsensusConfig::from_json(nlohmann::json::parse(R"({"genesis_time": 1})")));
        CHECK_FALSE(ConsensusConfig::from_json(nlohmann::json::parse(R"({"genesis_validators_root": "0x00", "genesis_time": 1})")));
        CHECK_FALSE(ConsensusConfig::from_json(nlohmann::json::parse(
            "{" + root + R"(, "genesis_time": 1, "beacon": {"CAPELLA_FORK_VERSION": "0x0301"}})")));
        CHECK_FALSE(ConsensusConfig::from_json(nlohmann::json::parse(
            "{" + root + R"(, "genesis_time": 1, "beacon": {"SLOTS_PER_EPOCH": 0}})")));
        CHECK_FALSE(ConsensusConfig::from_json(nlohmann::json::parse("{" + root + R"(, "genesis_time": "soon"})")));
        CHECK(ConsensusConfig::from_json(nlohmann::json::parse("{" + root + R"(, "genesis_time": 1})")));
    }
}

}  // namespace lantern::cl
