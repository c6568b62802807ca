// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

namespace lantern::cl {

std::string_view to_string(BootstrapError error) noexcept {
    return magic_enum::enum_name(error);
}

std::string_view to_string(ConsensusError error) noexcept {
    return magic_enum::enum_name(error);
}

}  // namespace lantern::cl
