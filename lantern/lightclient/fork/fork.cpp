// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "fork.hpp"

#include <algorithm>
#include <vector>

#include <lantern/core/crypto/sha256.hpp>
#include <lantern/lightclient/ssz/merkle.hpp>

namespace lantern::cl {

Hash32 compute_fork_data_root(const ForkVersion& current_version, const Hash32& genesis_validators_root) {
    ssz::Chunk version_chunk{};
    std::copy(current_version.cbegin(), current_version.cend(), version_chunk.bytes);
    return sha256(version_chunk, genesis_validators_root);
}

ForkDigest compute_fork_digest(const ForkVersion& current_version, const Hash32& genesis_validators_root) {
    const auto fork_data_root = compute_fork_data_root(current_version, genesis_validators_root);
    ForkDigest digest{};
    std::copy_n(fork_data_root.bytes, kForkDigestLength, digest.begin());
    return digest;
}

Domain compute_domain(const DomainType& domain_type, const ForkVersion& fork_version,
                      const Hash32& genesis_validators_root) {
    const auto fork_data_root = compute_fork_data_root(fork_version, genesis_validators_root);
    Domain domain{};
    std::copy(domain_type.cbegin(), domain_type.cend(), domain.bytes);
    std::copy_n(fork_data_root.bytes, sizeof(domain.bytes) - kDomainTypeLength, domain.bytes + kDomainTypeLength);
    return domain;
}

Hash32 compute_signing_root(const Hash32& object_root, const Domain& domain) {
    return sha256(object_root, domain);
}

Hash32 compute_sync_committee_signing_root(const ConsensusConfig& config, const Hash32& attested_block_root,
                                           Slot signature_slot) {
    const auto& bcc = config.beacon_chain_config;
    const Slot fork_slot{std::max<Slot>(signature_slot, 1) - 1};
    const auto fork_version = bcc.fork_version_at_epoch(bcc.compute_epoch_at_slot(fork_slot));
    const auto domain = compute_domain(kDomainSyncCommittee, fork_version, config.genesis_config.genesis_validators_root);
    return compute_signing_root(attested_block_root, domain);
}

}  // namespace lantern::cl
