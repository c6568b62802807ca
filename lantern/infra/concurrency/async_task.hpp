// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <exception>
#include <functional>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/compose.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <lantern/infra/concurrency/task.hpp>

namespace lantern::concurrency {

//! Default number of threads dedicated to EVM execution
inline const uint32_t kDefaultNumWorkers{std::max(1u, std::thread::hardware_concurrency() / 2)};

//! Pool of worker threads dedicated to heavier tasks, which must not block the I/O contexts
using WorkerPool = boost::asio::thread_pool;

template <typename R>
struct CompletionHandler {
    using type = void(std::exception_ptr, R);
};

template <>
struct CompletionHandler<void> {
    using type = void(std::exception_ptr);
};

template <typename F, typename... Args>
using TaskCompletionHandler = typename CompletionHandler<std::invoke_result_t<F, Args...>>::type;

//! Runs fn(args...) on the runner executor and resumes the awaiting coroutine on its own executor,
//! propagating either the result or the thrown exception
template <typename Executor, typename F, typename... Args>
Task<std::invoke_result_t<F, Args...>> async_task(Executor runner, F&& fn, Args&&... args) {
    using Result = std::invoke_result_t<F, Args...>;
    auto this_executor = co_await boost::asio::this_coro::executor;
    co_return co_await boost::asio::async_compose<decltype(boost::asio::use_awaitable), TaskCompletionHandler<F, Args...>>(
        [&this_executor, &runner, fn = std::forward<F>(fn), ... args = std::forward<Args>(args)](auto& self) mutable {
            boost::asio::post(runner, [&, fn = std::move(fn), ... args = std::move(args), self = std::move(self)]() mutable {
                std::exception_ptr eptr;
                if constexpr (std::is_void_v<Result>) {
                    try {
                        std::invoke(fn, args...);
                    } catch (...) {
                        eptr = std::current_exception();
                    }
                    boost::asio::post(this_executor, [eptr, self = std::move(self)]() mutable {
                        self.complete(eptr);
                    });
                } else {
                    Result result{};
                    try {
                        result = std::invoke(fn, args...);
                    } catch (...) {
                        eptr = std::current_exception();
                    }
                    boost::asio::post(this_executor, [eptr, result = std::move(result), self = std::move(self)]() mutable {
                        self.complete(eptr, std::move(result));
                    });
                }
            });
        },
        boost::asio::use_awaitable);
}

}  // namespace lantern::concurrency
