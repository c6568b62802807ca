// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <absl/strings/match.h>

#include <lantern/core/common/util.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>

namespace lantern::cl {

std::vector<ForkSchedule> BeaconChainConfig::sorted_fork_list() const {
    std::vector<ForkSchedule> fork_list{
        ForkSchedule{Fork::kGenesis, 0, genesis_fork_version},
        ForkSchedule{Fork::kAltair, altair_fork_epoch, altair_fork_version},
        ForkSchedule{Fork::kBellatrix, bellatrix_fork_epoch, bellatrix_fork_version},
        ForkSchedule{Fork::kCapella, capella_fork_epoch, capella_fork_version},
        ForkSchedule{Fork::kDeneb, deneb_fork_epoch, deneb_fork_version},
        ForkSchedule{Fork::kElectra, electra_fork_epoch, electra_fork_version},
    };
    std::stable_sort(fork_list.begin(), fork_list.end(), [](const auto& lhs, const auto& rhs) { return lhs.epoch < rhs.epoch; });
    return fork_list;
}

Fork BeaconChainConfig::fork_at_epoch(Epoch epoch) const {
    Fork current{Fork::kGenesis};
    for (const auto& schedule : sorted_fork_list()) {
        if (epoch < schedule.epoch) {
            break;
        }
        current = schedule.fork;
    }
    return current;
}

ForkVersion BeaconChainConfig::fork_version_at_epoch(Epoch epoch) const {
    ForkVersion current{genesis_fork_version};
    for (const auto& schedule : sorted_fork_list()) {
        if (epoch < schedule.epoch) {
            break;
        }
        current = schedule.version;
    }
    return current;
}

static std::optional<ForkVersion> parse_fork_version(const std::string& hex) {
    const auto bytes = from_hex(hex);
    if (!bytes || bytes->size() != kForkVersionLength) {
        return std::nullopt;
    }
    ForkVersion version{};
    std::copy(bytes->cbegin(), bytes->cend(), version.begin());
    return version;
}

static void read_json_member(const nlohmann::json& json, const char* key, uint64_t& target) {
    if (json.contains(key)) {
        const auto& value = json[key];
        target = value.is_string() ? std::stoull(value.get<std::string>()) : value.get<uint64_t>();
    }
}

static bool read_json_member(const nlohmann::json& json, const char* key, ForkVersion& target) {
    if (!json.contains(key)) {
        return true;
    }
    const auto version = parse_fork_version(json[key].get<std::string>());
    if (!version) {
        return false;
    }
    target = *version;
    return true;
}

std::optional<ConsensusConfig> ConsensusConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object() || !json.contains("genesis_validators_root") ||
        !json.contains("genesis_time")) {
        return std::nullopt;
    }

    ConsensusConfig config{mainnet_consensus_config()};
    try {
        const auto root = hex_to_bytes32(json["genesis_validators_root"].get<std::string>());
        if (!root) {
            return std::nullopt;
        }
        config.genesis_config.genesis_validators_root = *root;
        read_json_member(json, "genesis_time", config.genesis_config.genesis_time);

        if (json.contains("beacon")) {
            const auto& beacon = json["beacon"];
            auto& bcc = config.beacon_chain_config;
            read_json_member(beacon, "SECONDS_PER_SLOT", bcc.seconds_per_slot);
            read_json_member(beacon, "SLOTS_PER_EPOCH", bcc.slots_per_epoch);
            read_json_member(beacon, "EPOCHS_PER_SYNC_COMMITTEE_PERIOD", bcc.epochs_per_sync_committee_period);
            read_json_member(beacon, "SYNC_COMMITTEE_SIZE", bcc.sync_committee_size);
            const bool versions_ok = read_json_member(beacon, "GENESIS_FORK_VERSION", bcc.genesis_fork_version) &&
                                     read_json_member(beacon, "ALTAIR_FORK_VERSION", bcc.altair_fork_version) &&
                                     read_json_member(beacon, "BELLATRIX_FORK_VERSION", bcc.bellatrix_fork_version) &&
                                     read_json_member(beacon, "CAPELLA_FORK_VERSION", bcc.capella_fork_version) &&
                                     read_json_member(beacon, "DENEB_FORK_VERSION", bcc.deneb_fork_version) &&
                                     read_json_member(beacon, "ELECTRA_FORK_VERSION", bcc.electra_fork_version);
            if (!versions_ok) {
                return std::nullopt;
            }
            read_json_member(beacon, "ALTAIR_FORK_EPOCH", bcc.altair_fork_epoch);
            read_json_member(beacon, "BELLATRIX_FORK_EPOCH", bcc.bellatrix_fork_epoch);
            read_json_member(beacon, "CAPELLA_FORK_EPOCH", bcc.capella_fork_epoch);
            read_json_member(beacon, "DENEB_FORK_EPOCH", bcc.deneb_fork_epoch);
            read_json_member(beacon, "ELECTRA_FORK_EPOCH", bcc.electra_fork_epoch);
            if (bcc.seconds_per_slot == 0 || bcc.slots_per_epoch == 0 || bcc.epochs_per_sync_committee_period == 0 ||
                bcc.sync_committee_size == 0) {
                return std::nullopt;
            }
        }

        if (json.contains("execution")) {
            const auto chain_config = ChainConfig::from_json(json["execution"]);
            if (!chain_config) {
                return std::nullopt;
            }
            config.chain_config = *chain_config;
        }
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::logic_error&) {
        // std::stoull failures: invalid_argument and out_of_range
        return std::nullopt;
    }
    return config;
}

const ConsensusConfig& mainnet_consensus_config() {
    static const ConsensusConfig kConfig{kMainnetGenesisConfig, kMainnetBeaconConfig, kMainnetConfig};
    return kConfig;
}

const ConsensusConfig& sepolia_consensus_config() {
    static const ConsensusConfig kConfig{kSepoliaGenesisConfig, kSepoliaBeaconConfig, kSepoliaConfig};
    return kConfig;
}

const ConsensusConfig& holesky_consensus_config() {
    static const ConsensusConfig kConfig{kHoleskyGenesisConfig, kHoleskyBeaconConfig, kHoleskyConfig};
    return kConfig;
}

const ConsensusConfig* lookup_consensus_config(std::string_view network) noexcept {
    if (absl::EqualsIgnoreCase(network, "mainnet")) return &mainnet_consensus_config();
    if (absl::EqualsIgnoreCase(network, "sepolia")) return &sepolia_consensus_config();
    if (absl::EqualsIgnoreCase(network, "holesky")) return &holesky_consensus_config();
    return nullptr;
}

const ConsensusConfig* lookup_consensus_config(ChainId chain_id) noexcept {
    if (chain_id == kMainnetConfig.chain_id) return &mainnet_consensus_config();
    if (chain_id == kSepoliaConfig.chain_id) return &sepolia_consensus_config();
    if (chain_id == kHoleskyConfig.chain_id) return &holesky_consensus_config();
    return nullptr;
}

}  // namespace lantern::cl
