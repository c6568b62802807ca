// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

#include <lantern/lightclient/params/config.hpp>
#include <lantern/lightclient/state/store.hpp>
#include <lantern/lightclient/sync/errors.hpp>
#include <lantern/lightclient/types/types.hpp>

// Verification and application of light client data, see consensus-specs altair/light-client/sync-protocol.md
namespace lantern::cl {

//! What a successfully applied update changed in the store
struct UpdateOutcome {
    bool optimistic_advanced{false};
    bool finalized_advanced{false};
    bool next_committee_learned{false};
    bool committee_rotated{false};
};

using BootstrapResult = tl::expected<LightClientStore, BootstrapError>;
using UpdateResult = tl::expected<UpdateOutcome, ConsensusError>;

//! \brief Builds the initial store from a bootstrap whose header must hash to the trusted checkpoint root
BootstrapResult bootstrap(const Hash32& checkpoint_root, const LightClientBootstrap& bootstrap,
                          const ConsensusConfig& config);

//! \brief Checks every claim of the update against the store without changing it
//! \param current_slot the wall-clock slot, signatures from later slots are rejected
tl::expected<void, ConsensusError> validate_update(const LightClientStore& store, const LightClientUpdate& update,
                                                   const ConsensusConfig& config, Slot current_slot);

//! \brief Validates the update and, only if valid, applies it to the store
//! \remarks A failed update leaves the store untouched
UpdateResult apply_update(LightClientStore& store, const LightClientUpdate& update, const ConsensusConfig& config,
                          Slot current_slot);

using ProcessError = std::variant<BootstrapError, ConsensusError>;
using ProcessResult = tl::expected<UpdateOutcome, ProcessError>;

std::string_view to_string(const ProcessError& error) noexcept;

//! \brief Single verification entry point for any light client message
//! \details A checkpoint bootstrap (re)initializes the store, every update kind requires a store
ProcessResult process(std::optional<LightClientStore>& store, const LightClientMessage& message,
                      const ConsensusConfig& config, Slot current_slot);

}  // namespace lantern::cl
