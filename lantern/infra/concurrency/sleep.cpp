// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "sleep.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace lantern {

Task<void> sleep(std::chrono::milliseconds duration) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer{executor};
    timer.expires_after(duration);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

}  // namespace lantern
