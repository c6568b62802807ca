// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

namespace lantern::execution {

std::string_view to_string(ExecutionErrorCode code) noexcept {
    return magic_enum::enum_name(code);
}

ExecutionError::ExecutionError(ExecutionErrorCode code, const std::string& message)
    : std::runtime_error{std::string{to_string(code)} + ": " + message}, code_{code} {}

}  // namespace lantern::execution
