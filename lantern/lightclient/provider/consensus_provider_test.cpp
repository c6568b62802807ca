// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "consensus_provider.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <lantern/infra/test_util/log.hpp>
#include <lantern/infra/test_util/task_runner.hpp>
#include <lantern/lightclient/test_util/mock_beacon_chain.hpp>
#include <lantern/lightclient/test_util/mock_consensus_provider.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::cl {

using namespace std::chrono_literals;
using testing::_;
using testing::InvokeWithoutArgs;
using test_util::MockConsensusProvider;

static const concurrency::RetryPolicy kFastRetry{.max_attempts = 2, .initial_backoff = 1ms, .max_backoff = 1ms};

TEST_CASE("FallbackConsensusProvider", "[lightclient][provider]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    test_util::MockBeaconChain chain;
    const auto block = chain.make_block(8);
    const auto bootstrap = chain.make_bootstrap(block);

    auto primary = std::make_shared<MockConsensusProvider>();
    auto secondary = std::make_shared<MockConsensusProvider>();
    FallbackConsensusProvider provider{{primary, secondary}, kFastRetry};

    SECTION("primary serves") {
        EXPECT_CALL(*primary, get_bootstrap(block.root())).WillOnce(InvokeWithoutArgs([&]() -> Task<LightClientBootstrap> {
            co_return bootstrap;
        }));
        EXPECT_CALL(*secondary, get_bootstrap(_)).Times(0);
        CHECK(runner.run(provider.get_bootstrap(block.root())) == bootstrap);
    }

    SECTION("primary retried before falling back") {
        EXPECT_CALL(*primary, get_updates(0, 1))
            .Times(2)
            .WillRepeatedly(InvokeWithoutArgs([]() -> Task<std::vector<LightClientUpdate>> {
                throw std::runtime_error{"503 Service Unavailable"};
                co_return std::vector<LightClientUpdate>{};
            }));
        EXPECT_CALL(*secondary, get_updates(0, 1)).WillOnce(InvokeWithoutArgs([]() -> Task<std::vector<LightClientUpdate>> {
            co_return std::vector<LightClientUpdate>(1);
        }));
        CHECK(runner.run(provider.get_updates(0, 1)).size() == 1);

        // The provider that answered is now tried first
        EXPECT_CALL(*secondary, get_updates(1, 1)).WillOnce(InvokeWithoutArgs([]() -> Task<std::vector<LightClientUpdate>> {
            co_return std::vector<LightClientUpdate>{};
        }));
        CHECK(runner.run(provider.get_updates(1, 1)).empty());
    }

    SECTION("all providers exhausted") {
        auto failing = []() -> Task<LightClientOptimisticUpdate> {
            throw std::runtime_error{"connection refused"};
            co_return LightClientOptimisticUpdate{};
        };
        EXPECT_CALL(*primary, get_optimistic_update()).Times(2).WillRepeatedly(InvokeWithoutArgs(failing));
        EXPECT_CALL(*secondary, get_optimistic_update()).Times(2).WillRepeatedly(InvokeWithoutArgs(failing));
        CHECK_THROWS_AS(runner.run(provider.get_optimistic_update()), rpc::ProviderError);
    }
}

TEST_CASE("FallbackConsensusProvider needs a provider", "[lightclient][provider]") {
    CHECK_THROWS_AS(FallbackConsensusProvider({}, kFastRetry), std::invalid_argument);
}

}  // namespace lantern::cl
