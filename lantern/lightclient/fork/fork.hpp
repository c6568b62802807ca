// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>

#include <lantern/lightclient/params/config.hpp>

namespace lantern::cl {

inline constexpr size_t kDomainTypeLength{4};
inline constexpr size_t kForkDigestLength{4};

using DomainType = std::array<uint8_t, kDomainTypeLength>;
using Domain = Hash32;
using ForkDigest = std::array<uint8_t, kForkDigestLength>;

inline constexpr DomainType kDomainSyncCommittee{0x07, 0x00, 0x00, 0x00};

//! \brief hash_tree_root(ForkData{current_version, genesis_validators_root})
Hash32 compute_fork_data_root(const ForkVersion& current_version, const Hash32& genesis_validators_root);

//! \brief Fork digest: the first 4 bytes of the fork data root
ForkDigest compute_fork_digest(const ForkVersion& current_version, const Hash32& genesis_validators_root);

//! \brief Domain: the domain type followed by the first 28 bytes of the fork data root
Domain compute_domain(const DomainType& domain_type, const ForkVersion& fork_version,
                      const Hash32& genesis_validators_root);

//! \brief hash_tree_root(SigningData{object_root, domain})
Hash32 compute_signing_root(const Hash32& object_root, const Domain& domain);

//! \brief The message the sync committee signs at signature_slot for the attested beacon block root
//! \remarks The fork version is the one active at signature_slot - 1, i.e. the slot of the signed block at the latest
Hash32 compute_sync_committee_signing_root(const ConsensusConfig& config, const Hash32& attested_block_root,
                                           Slot signature_slot);

}  // namespace lantern::cl
