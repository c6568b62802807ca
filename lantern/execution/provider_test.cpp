// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <lantern/execution/test_util/mock_execution_provider.hpp>
#include <lantern/execution/test_util/proven_state.hpp>
#include <lantern/infra/test_util/log.hpp>
#include <lantern/infra/test_util/task_runner.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::execution {

using namespace evmc::literals;
using namespace std::chrono_literals;
using testing::_;
using testing::InvokeWithoutArgs;
using test_util::MockExecutionProvider;

static const concurrency::RetryPolicy kFastRetry{.max_attempts = 3, .initial_backoff = 1ms, .max_backoff = 1ms};
static constexpr auto kAlice{0x00000000000000000000000000000000000a11ce_address};

TEST_CASE("FallbackExecutionProvider", "[execution][provider]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    test_util::ProvenState state;
    state.set_account(kAlice, Account{.balance = 1000});

    auto primary = std::make_shared<MockExecutionProvider>();
    auto secondary = std::make_shared<MockExecutionProvider>();
    FallbackExecutionProvider provider{{primary, secondary}, kFastRetry};

    SECTION("transient failure retried on the same provider") {
        int attempts{0};
        EXPECT_CALL(*primary, get_proof(kAlice, std::vector<evmc::bytes32>{}, 7))
            .Times(2)
            .WillRepeatedly(InvokeWithoutArgs([&]() -> Task<AccountProof> {
                if (++attempts == 1) {
                    throw std::runtime_error{"429 Too Many Requests"};
                }
                co_return state.get_proof(kAlice, {});
            }));
        EXPECT_CALL(*secondary, get_proof(_, _, _)).Times(0);
        CHECK(runner.run(provider.get_proof(kAlice, {}, 7)).account.balance == 1000);
    }

    SECTION("falls back to the next provider") {
        EXPECT_CALL(*primary, get_code(kAlice, 7)).Times(3).WillRepeatedly(InvokeWithoutArgs([]() -> Task<Bytes> {
            throw std::runtime_error{"connection reset"};
            co_return Bytes{};
        }));
        EXPECT_CALL(*secondary, get_code(kAlice, 7)).WillOnce(InvokeWithoutArgs([]() -> Task<Bytes> {
            co_return Bytes{0x60, 0x00};
        }));
        CHECK(runner.run(provider.get_code(kAlice, 7)) == Bytes{0x60, 0x00});
    }

    SECTION("all providers exhausted") {
        auto failing = []() -> Task<std::vector<AccessListEntry>> {
            throw std::runtime_error{"execution timeout"};
            co_return std::vector<AccessListEntry>{};
        };
        EXPECT_CALL(*primary, create_access_list(_, _)).Times(3).WillRepeatedly(InvokeWithoutArgs(failing));
        EXPECT_CALL(*secondary, create_access_list(_, _)).Times(3).WillRepeatedly(InvokeWithoutArgs(failing));
        CHECK_THROWS_AS(runner.run(provider.create_access_list(CallRequest{.to = kAlice}, 7)), rpc::ProviderError);
    }
}

}  // namespace lantern::execution
