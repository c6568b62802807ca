// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <lantern/core/common/bytes.hpp>

namespace lantern::execution {

enum class ExecutionErrorCode {
    kProofUnavailable,    // the provider did not return the requested proof
    kInvalidProof,        // a proof does not verify against the trusted state root
    kProviderExhausted,   // every execution provider failed, retries included
    kHeaderNotSynced,     // no trusted head has been published yet
    kUnsupportedFork,     // the block revision is older than Shanghai or unknown to the chain config
    kBlockNotAvailable,   // the requested block is not among the trusted headers
    kInvalidCode,         // the code served does not hash to the proven code hash
};

std::string_view to_string(ExecutionErrorCode code) noexcept;

//! Infrastructure failure of a client operation: unlike an EVM failure it means no trusted result exists
class ExecutionError : public std::runtime_error {
  public:
    ExecutionError(ExecutionErrorCode code, const std::string& message);

    ExecutionErrorCode code() const noexcept { return code_; }

  private:
    ExecutionErrorCode code_;
};

//! A call that cannot succeed with any gas amount up to the cap
class EstimateGasError : public std::runtime_error {
  public:
    EstimateGasError(const std::string& message, Bytes data)
        : std::runtime_error{message}, data_{std::move(data)} {}

    //! Revert data of the failed call, if any
    const Bytes& data() const noexcept { return data_; }

  private:
    Bytes data_;
};

}  // namespace lantern::execution
