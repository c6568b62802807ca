// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace lantern::cl {

enum class [[nodiscard]] BootstrapError {
    kCheckpointMismatch,      // the bootstrap header does not hash to the trusted checkpoint root
    kInvalidCommitteeProof,   // the current sync committee is not proven by the header state root
    kInvalidExecutionProof,   // the execution header is not proven by the header body root
};

enum class [[nodiscard]] ConsensusError {
    kNotRelevant,                 // the update carries nothing newer than the store
    kInsufficientParticipation,   // less than 2/3 of the sync committee signed
    kInvalidSignature,            // the aggregate signature does not verify
    kInvalidCommitteeProof,       // the next sync committee is not proven by the attested state root
    kInvalidFinalityProof,        // the finalized header is not proven by the attested state root
    kInvalidExecutionProof,       // an execution header is not proven by its beacon body root
    kInvalidPeriod,               // the signature slot is neither in the current nor in the next period
    kInvalidTimestamp,            // the update slots are out of order or in the future
    kMissingNextCommittee,        // signed in the next period whose committee is still unknown
    kNotBootstrapped,             // no trusted checkpoint yet
};

std::string_view to_string(BootstrapError error) noexcept;
std::string_view to_string(ConsensusError error) noexcept;

}  // namespace lantern::cl
