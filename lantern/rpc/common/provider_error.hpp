// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace lantern::rpc {

//! Every configured provider failed to serve a request, retries included
class ProviderError : public std::runtime_error {
  public:
    explicit ProviderError(const std::string& what) : std::runtime_error{what} {}
};

}  // namespace lantern::rpc
