// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <gmock/gmock.h>

#include <lantern/execution/provider.hpp>

namespace lantern::test_util {

class MockExecutionProvider : public execution::ExecutionProvider {
  public:
    MOCK_METHOD((Task<AccountProof>), get_proof, (const evmc::address&, std::vector<evmc::bytes32>, BlockNum),
                (override));
    MOCK_METHOD((Task<Bytes>), get_code, (const evmc::address&, BlockNum), (override));
    MOCK_METHOD((Task<std::vector<AccessListEntry>>), create_access_list, (const CallRequest&, BlockNum),
                (override));
};

}  // namespace lantern::test_util
