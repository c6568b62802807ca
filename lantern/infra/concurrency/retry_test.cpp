// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "retry.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <lantern/infra/test_util/task_runner.hpp>

namespace lantern::concurrency {

using namespace std::chrono_literals;

TEST_CASE("RetryPolicy backoff", "[infra][concurrency][retry]") {
    const RetryPolicy policy{.max_attempts = 10, .initial_backoff = 50ms, .max_backoff = 1s, .multiplier = 2.0};
    CHECK(policy.backoff(1) == 50ms);
    CHECK(policy.backoff(2) == 100ms);
    CHECK(policy.backoff(3) == 200ms);
    CHECK(policy.backoff(5) == 800ms);
    CHECK(policy.backoff(6) == 1s);
    CHECK(policy.backoff(1000) == 1s);
}

TEST_CASE("retry", "[infra][concurrency][retry]") {
    test_util::TaskRunner runner;
    const RetryPolicy policy{.max_attempts = 3, .initial_backoff = 1ms, .max_backoff = 2ms};
    int calls{0};

    SECTION("success at first attempt") {
        auto attempt = [&]() -> Task<int> {
            ++calls;
            co_return 42;
        };
        CHECK(runner.run(retry<int>(policy, attempt, "answer")) == 42);
        CHECK(calls == 1);
    }

    SECTION("success after failures") {
        auto attempt = [&]() -> Task<int> {
            if (++calls < 3) {
                throw std::runtime_error{"unavailable"};
            }
            co_return calls;
        };
        CHECK(runner.run(retry<int>(policy, attempt, "flaky")) == 3);
    }

    SECTION("attempts exhausted") {
        auto attempt = [&]() -> Task<void> {
            ++calls;
            throw std::runtime_error{"down"};
            co_return;
        };
        CHECK_THROWS_AS(runner.run(retry<void>(policy, attempt, "down")), std::runtime_error);
        CHECK(calls == 3);
    }

    SECTION("cancellation is not retried") {
        auto attempt = [&]() -> Task<void> {
            ++calls;
            throw boost::system::system_error{boost::asio::error::operation_aborted};
            co_return;
        };
        CHECK_THROWS_AS(runner.run(retry<void>(policy, attempt, "cancelled")), boost::system::system_error);
        CHECK(calls == 1);
    }
}

}  // namespace lantern::concurrency
