// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_pool.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <lantern/infra/common/ensure.hpp>
#include <lantern/infra/common/log.hpp>

namespace lantern::concurrency {

std::ostream& operator<<(std::ostream& out, const Context& c) {
    out << "io_context: " << c.ioc() << " id: " << c.id();
    return out;
}

Context::Context(size_t context_id)
    : context_id_{context_id},
      ioc_{std::make_shared<boost::asio::io_context>()},
      work_{boost::asio::make_work_guard(*ioc_)} {}

void Context::execute_loop() {
    LANTERN_DEBUG << "Context execution loop start [" << std::this_thread::get_id() << "]";
    ioc_->run();
    LANTERN_DEBUG << "Context execution loop end [" << std::this_thread::get_id() << "]";
}

void Context::stop() {
    ioc_->stop();
}

ContextPool::ContextPool(uint32_t num_contexts) {
    ensure(num_contexts > 0, "ContextPool size is 0");
    contexts_.reserve(num_contexts);
    for (size_t i{0}; i < num_contexts; ++i) {
        contexts_.emplace_back(i);
    }
}

ContextPool::~ContextPool() {
    LANTERN_TRACE << "ContextPool::~ContextPool START " << this;
    stop();
    join();
    LANTERN_TRACE << "ContextPool::~ContextPool END " << this;
}

void ContextPool::start() {
    LANTERN_TRACE << "ContextPool::start START";
    for (size_t i{0}; i < contexts_.size(); ++i) {
        auto& context = contexts_[i];
        context_threads_.emplace_back([&, i]() {
            log::set_thread_name(("asio_ctx_s" + std::to_string(i)).c_str());
            LANTERN_TRACE << "Thread start context[" << i << "] thread_id: " << std::this_thread::get_id();
            try {
                context.execute_loop();
            } catch (const std::exception& ex) {
                LANTERN_CRIT << "ContextPool context.execute_loop exception: " << ex.what();
                exception_handler_(std::current_exception());
            }
            LANTERN_TRACE << "Thread end context[" << i << "] thread_id: " << std::this_thread::get_id();
        });
        LANTERN_TRACE << "ContextPool::start context[" << i << "] started: " << context.ioc();
    }
    LANTERN_TRACE << "ContextPool::start END";
}

void ContextPool::join() {
    LANTERN_TRACE << "ContextPool::join START";
    for (auto& thread : context_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    LANTERN_TRACE << "ContextPool::join END";
}

void ContextPool::stop() {
    LANTERN_TRACE << "ContextPool::stop START";
    if (!stopped_.exchange(true)) {
        for (size_t i{0}; i < contexts_.size(); ++i) {
            contexts_[i].stop();
            LANTERN_TRACE << "ContextPool::stop context[" << i << "] stopped: " << contexts_[i].ioc();
        }
    }
    LANTERN_TRACE << "ContextPool::stop END";
}

Context& ContextPool::next_context() {
    // Increment the next index first to make sure that different calling threads get different contexts.
    const size_t index = next_index_.fetch_add(1) % contexts_.size();
    return contexts_[index];
}

}  // namespace lantern::concurrency
