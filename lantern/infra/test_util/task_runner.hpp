// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <lantern/infra/concurrency/task.hpp>

namespace lantern::test_util {

//! Drives Task-s to completion on a private io_context polled by the test thread
class TaskRunner {
  public:
    TaskRunner() = default;
    virtual ~TaskRunner() = default;

    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = spawn_future(std::move(task));
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    template <typename TResult>
    std::future<TResult> spawn_future(Task<TResult> task) {
        return boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    template <typename TResult>
    void poll_context_until_future_is_ready(std::future<TResult>& future) {
        using namespace std::chrono_literals;
        ioc_.restart();
        while (future.wait_for(0s) != std::future_status::ready) {
            ioc_.poll_one();
        }
    }

    //! Runs the ready handlers until none is left, i.e. until every spawned task is blocked or done
    void poll_until_idle() {
        ioc_.restart();
        while (ioc_.poll_one() > 0) {
        }
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  protected:
    boost::asio::io_context ioc_;
};

}  // namespace lantern::test_util
