// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <chrono>
#include <future>

#include <catch2/catch_test_macros.hpp>

#include <lantern/infra/test_util/task_runner.hpp>

namespace lantern::concurrency {

using namespace std::chrono_literals;

TEST_CASE("AwaitableConditionVariable", "[infra][concurrency]") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable cond_var;

    SECTION("a waiter taken before notify_all does not block") {
        auto waiter = cond_var.waiter();
        cond_var.notify_all();
        runner.run(waiter());
    }

    SECTION("waiting blocks until notified") {
        auto waiter = cond_var.waiter();
        auto future = runner.spawn_future(waiter());
        runner.poll_until_idle();
        CHECK(future.wait_for(0s) == std::future_status::timeout);

        cond_var.notify_all();
        runner.poll_context_until_future_is_ready(future);
    }

    SECTION("notify_all awakes every waiter") {
        auto waiter1 = cond_var.waiter();
        auto waiter2 = cond_var.waiter();
        auto future1 = runner.spawn_future(waiter1());
        auto future2 = runner.spawn_future(waiter2());
        runner.poll_until_idle();

        cond_var.notify_all();
        runner.poll_context_until_future_is_ready(future1);
        runner.poll_context_until_future_is_ready(future2);
    }
}

}  // namespace lantern::concurrency
