// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_pool.hpp"

#include <atomic>
#include <future>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <boost/asio/post.hpp>
#include <catch2/catch_test_macros.hpp>

namespace lantern::concurrency {

TEST_CASE("Context", "[infra][concurrency]") {
    Context ctx{0};

    SECTION("execute_loop") {
        std::atomic_bool context_thread_failed{false};
        std::thread context_thread{[&]() {
            try {
                ctx.execute_loop();
            } catch (const std::exception&) {
                context_thread_failed = true;
            }
        }};
        ctx.stop();
        context_thread.join();
        CHECK(!context_thread_failed);
    }

    SECTION("stop") {
        std::thread context_thread{[&]() { ctx.execute_loop(); }};
        CHECK(!ctx.ioc()->stopped());
        ctx.stop();
        CHECK(ctx.ioc()->stopped());
        context_thread.join();
        ctx.stop();
        CHECK(ctx.ioc()->stopped());
    }

    SECTION("print") {
        std::ostringstream out;
        out << ctx;
        CHECK(out.str().find("id: 0") != std::string::npos);
    }
}

TEST_CASE("ContextPool", "[infra][concurrency]") {
    SECTION("size") {
        ContextPool context_pool{2};
        CHECK(context_pool.size() == 2);
    }

    SECTION("empty pool") {
        CHECK_THROWS_AS(ContextPool{0}, std::logic_error);
    }

    SECTION("next_context is round robin") {
        ContextPool context_pool{2};
        auto& context1 = context_pool.next_context();
        auto& context2 = context_pool.next_context();
        auto& context3 = context_pool.next_context();
        CHECK(context1.id() == 0);
        CHECK(context2.id() == 1);
        CHECK(&context3 == &context1);
    }

    SECTION("start, run handlers, stop and join") {
        ContextPool context_pool{2};
        context_pool.start();
        std::promise<std::thread::id> ran;
        boost::asio::post(context_pool.next_ioc(), [&]() { ran.set_value(std::this_thread::get_id()); });
        CHECK(ran.get_future().get() != std::this_thread::get_id());
        context_pool.stop();
        context_pool.join();
    }
}

}  // namespace lantern::concurrency
