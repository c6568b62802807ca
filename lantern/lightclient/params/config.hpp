// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <lantern/core/chain/config.hpp>
#include <lantern/core/common/base.hpp>

namespace lantern::cl {

inline constexpr size_t kForkVersionLength{4};

using ForkVersion = std::array<uint8_t, kForkVersionLength>;
using Hash32 = evmc::bytes32;

inline constexpr Epoch kFarFutureEpoch{std::numeric_limits<uint64_t>::max()};

//! Consensus layer forks relevant to light client data
enum class Fork {
    kGenesis,
    kAltair,
    kBellatrix,
    kCapella,
    kDeneb,
    kElectra,
};

struct ForkSchedule {
    Fork fork;
    Epoch epoch;
    ForkVersion version;
};

//! Configuration parameters of the beacon chain needed to follow it through sync committees
struct BeaconChainConfig {
    // Time parameters
    uint64_t seconds_per_slot{12};
    uint64_t slots_per_epoch{32};
    uint64_t epochs_per_sync_committee_period{256};
    uint64_t sync_committee_size{512};

    // Fork-related values
    ForkVersion genesis_fork_version{};
    ForkVersion altair_fork_version{};
    Epoch altair_fork_epoch{kFarFutureEpoch};
    ForkVersion bellatrix_fork_version{};
    Epoch bellatrix_fork_epoch{kFarFutureEpoch};
    ForkVersion capella_fork_version{};
    Epoch capella_fork_epoch{kFarFutureEpoch};
    ForkVersion deneb_fork_version{};
    Epoch deneb_fork_epoch{kFarFutureEpoch};
    ForkVersion electra_fork_version{};
    Epoch electra_fork_epoch{kFarFutureEpoch};

    std::vector<ForkSchedule> sorted_fork_list() const;

    Epoch compute_epoch_at_slot(Slot slot) const noexcept { return slot / slots_per_epoch; }

    uint64_t slots_per_sync_committee_period() const noexcept {
        return slots_per_epoch * epochs_per_sync_committee_period;
    }

    //! \brief The sync committee period a slot belongs to
    uint64_t sync_committee_period(Slot slot) const noexcept { return slot / slots_per_sync_committee_period(); }

    //! \brief The latest fork activated at epoch
    Fork fork_at_epoch(Epoch epoch) const;

    Fork fork_at_slot(Slot slot) const { return fork_at_epoch(compute_epoch_at_slot(slot)); }

    //! \brief The version of the latest fork activated at epoch
    ForkVersion fork_version_at_epoch(Epoch epoch) const;

    friend bool operator==(const BeaconChainConfig&, const BeaconChainConfig&) = default;
};

//! Configuration parameters of the beacon chain genesis
struct GenesisConfig {
    Hash32 genesis_validators_root;  // Merkle root of the validator registry at genesis
    uint64_t genesis_time{0};        // Unix time of the genesis slot

    friend bool operator==(const GenesisConfig&, const GenesisConfig&) = default;
};

struct ConsensusConfig {
    GenesisConfig genesis_config;
    BeaconChainConfig beacon_chain_config;
    //! Execution layer fork schedule of the same network
    ChainConfig chain_config;

    //! \brief Parses a consensus config object, e.g. {"genesis_time": .., "genesis_validators_root": .., "beacon": {..}}
    //! \remarks Missing beacon chain members keep the mainnet preset value
    static std::optional<ConsensusConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const ConsensusConfig&, const ConsensusConfig&) = default;
};

using namespace evmc::literals;

inline constexpr BeaconChainConfig kMainnetBeaconConfig{
    .genesis_fork_version = {0x00, 0x00, 0x00, 0x00},
    .altair_fork_version = {0x01, 0x00, 0x00, 0x00},
    .altair_fork_epoch = 74240,
    .bellatrix_fork_version = {0x02, 0x00, 0x00, 0x00},
    .bellatrix_fork_epoch = 144896,
    .capella_fork_version = {0x03, 0x00, 0x00, 0x00},
    .capella_fork_epoch = 194048,
    .deneb_fork_version = {0x04, 0x00, 0x00, 0x00},
    .deneb_fork_epoch = 269568,
    .electra_fork_version = {0x05, 0x00, 0x00, 0x00},
    .electra_fork_epoch = 364032,
};

inline constexpr BeaconChainConfig kSepoliaBeaconConfig{
    .genesis_fork_version = {0x90, 0x00, 0x00, 0x69},
    .altair_fork_version = {0x90, 0x00, 0x00, 0x70},
    .altair_fork_epoch = 50,
    .bellatrix_fork_version = {0x90, 0x00, 0x00, 0x71},
    .bellatrix_fork_epoch = 100,
    .capella_fork_version = {0x90, 0x00, 0x00, 0x72},
    .capella_fork_epoch = 56832,
    .deneb_fork_version = {0x90, 0x00, 0x00, 0x73},
    .deneb_fork_epoch = 132608,
    .electra_fork_version = {0x90, 0x00, 0x00, 0x74},
    .electra_fork_epoch = 222464,
};

inline constexpr BeaconChainConfig kHoleskyBeaconConfig{
    .genesis_fork_version = {0x01, 0x01, 0x70, 0x00},
    .altair_fork_version = {0x02, 0x01, 0x70, 0x00},
    .altair_fork_epoch = 0,
    .bellatrix_fork_version = {0x03, 0x01, 0x70, 0x00},
    .bellatrix_fork_epoch = 0,
    .capella_fork_version = {0x04, 0x01, 0x70, 0x00},
    .capella_fork_epoch = 256,
    .deneb_fork_version = {0x05, 0x01, 0x70, 0x00},
    .deneb_fork_epoch = 29696,
    .electra_fork_version = {0x06, 0x01, 0x70, 0x00},
    .electra_fork_epoch = 115968,
};

//! Minimal preset of the consensus specs: small committees and short periods, all forks from genesis
inline constexpr BeaconChainConfig kMinimalBeaconConfig{
    .seconds_per_slot = 6,
    .slots_per_epoch = 8,
    .epochs_per_sync_committee_period = 8,
    .sync_committee_size = 32,
    .genesis_fork_version = {0x00, 0x00, 0x00, 0x01},
    .altair_fork_version = {0x01, 0x00, 0x00, 0x01},
    .altair_fork_epoch = 0,
    .bellatrix_fork_version = {0x02, 0x00, 0x00, 0x01},
    .bellatrix_fork_epoch = 0,
    .capella_fork_version = {0x03, 0x00, 0x00, 0x01},
    .capella_fork_epoch = 0,
    .deneb_fork_version = {0x04, 0x00, 0x00, 0x01},
    .deneb_fork_epoch = 0,
};

inline constexpr GenesisConfig kMainnetGenesisConfig{
    .genesis_validators_root = 0x4b363db94e286120d76eb905340fdd4e54bfe9f06bf33ff6cf5ad27f511bfe95_bytes32,
    .genesis_time = 1606824023,
};

inline constexpr GenesisConfig kSepoliaGenesisConfig{
    .genesis_validators_root = 0xd8ea171f3c94aea21ebc42a1ed61052acf3f9209c00e4efbaaddac09ed9b8078_bytes32,
    .genesis_time = 1655733600,
};

inline constexpr GenesisConfig kHoleskyGenesisConfig{
    .genesis_validators_root = 0x9143aa7c615a7f7115e2b6aac319c03529df8242ae705fba9df39b79c59fa8b1_bytes32,
    .genesis_time = 1695902400,
};

const ConsensusConfig& mainnet_consensus_config();
const ConsensusConfig& sepolia_consensus_config();
const ConsensusConfig& holesky_consensus_config();

//! \brief Looks up a known consensus config by network name (case insensitive)
const ConsensusConfig* lookup_consensus_config(std::string_view network) noexcept;

//! \brief Looks up a known consensus config by execution chain identifier
const ConsensusConfig* lookup_consensus_config(ChainId chain_id) noexcept;

}  // namespace lantern::cl
