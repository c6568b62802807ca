// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace lantern::concurrency {

//! Asynchronous scheduler running an execution loop.
class Context {
  public:
    explicit Context(size_t context_id);

    boost::asio::io_context* ioc() const noexcept { return ioc_.get(); }
    size_t id() const noexcept { return context_id_; }

    //! Execute the scheduler loop until stopped.
    void execute_loop();

    //! Stop the execution loop.
    void stop();

  private:
    //! The unique scheduler identifier.
    size_t context_id_;

    //! The asio asynchronous event loop scheduler.
    std::shared_ptr<boost::asio::io_context> ioc_;

    //! The work-tracking executor that keep the asio scheduler running.
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
};

std::ostream& operator<<(std::ostream& out, const Context& c);

//! Pool of \ref Context instances running as separate reactive schedulers, one thread each.
class ContextPool {
  public:
    using ExceptionHandler = std::function<void(std::exception_ptr)>;

    explicit ContextPool(uint32_t num_contexts);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    //! Start one execution thread for each context.
    void start();

    //! Wait for termination of all execution threads.
    //!\warning This will block until \ref stop() is called.
    void join();

    //! Stop all execution threads. This does *NOT* wait for termination: use \ref join() for that.
    void stop();

    size_t size() const { return contexts_.size(); }

    //! Use a round-robin scheme to choose the next context to use
    Context& next_context();

    boost::asio::io_context& next_ioc() { return *next_context().ioc(); }

    void set_exception_handler(ExceptionHandler exception_handler) { exception_handler_ = std::move(exception_handler); }

  private:
    std::vector<Context> contexts_;
    std::vector<std::thread> context_threads_;
    std::atomic<size_t> next_index_{0};
    std::atomic_bool stopped_{false};
    ExceptionHandler exception_handler_{[](const std::exception_ptr& ex_ptr) { std::rethrow_exception(ex_ptr); }};
};

}  // namespace lantern::concurrency
