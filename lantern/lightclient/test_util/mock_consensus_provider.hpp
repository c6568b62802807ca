// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <gmock/gmock.h>

#include <lantern/lightclient/provider/consensus_provider.hpp>

namespace lantern::test_util {

class MockConsensusProvider : public cl::ConsensusProvider {
  public:
    MOCK_METHOD((Task<cl::LightClientBootstrap>), get_bootstrap, (const cl::Hash32&), (override));
    MOCK_METHOD((Task<std::vector<cl::LightClientUpdate>>), get_updates, (uint64_t, uint64_t), (override));
    MOCK_METHOD((Task<cl::LightClientFinalityUpdate>), get_finality_update, (), (override));
    MOCK_METHOD((Task<cl::LightClientOptimisticUpdate>), get_optimistic_update, (), (override));
};

}  // namespace lantern::test_util
