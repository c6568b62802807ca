// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>

namespace lantern {

//! \brief SHA-256 digest of data, the hash function of SSZ merkleization
evmc::bytes32 sha256(ByteView data) noexcept;

//! \brief SHA-256 digest of the concatenation of two 32-byte chunks
evmc::bytes32 sha256(const evmc::bytes32& left, const evmc::bytes32& right) noexcept;

}  // namespace lantern
