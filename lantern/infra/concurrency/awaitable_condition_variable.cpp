// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <list>
#include <mutex>

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <gsl/util>

namespace lantern::concurrency {

// One-shot wake up signal of a single waiter
using Signal = boost::asio::experimental::concurrent_channel<void(boost::system::error_code)>;

class AwaitableConditionVariableImpl {
  public:
    std::function<Task<void>()> waiter() {
        size_t waiter_version{0};
        {
            std::scoped_lock lock(mutex_);
            waiter_version = version_;
        }

        return [this, waiter_version]() -> Task<void> {
            auto executor = co_await boost::asio::this_coro::executor;

            std::list<Signal>::iterator signal;
            {
                std::scoped_lock lock(mutex_);
                // notify_all happened after the waiter was taken
                if (waiter_version != version_) {
                    co_return;
                }
                signal = signals_.emplace(signals_.end(), executor, 1);
            }

            [[maybe_unused]] auto _ = gsl::finally([&]() {
                std::scoped_lock lock(mutex_);
                signals_.erase(signal);
            });
            co_await signal->async_receive(boost::asio::use_awaitable);
        };
    }

    void notify_all() {
        std::scoped_lock lock(mutex_);
        ++version_;
        for (auto& signal : signals_) {
            signal.try_send(boost::system::error_code{});
        }
    }

  private:
    std::mutex mutex_;
    std::list<Signal> signals_;
    size_t version_{0};
};

AwaitableConditionVariable::AwaitableConditionVariable()
    : p_impl_(std::make_unique<AwaitableConditionVariableImpl>()) {}

AwaitableConditionVariable::~AwaitableConditionVariable() = default;

AwaitableConditionVariable::Waiter AwaitableConditionVariable::waiter() {
    return p_impl_->waiter();
}

void AwaitableConditionVariable::notify_all() {
    p_impl_->notify_all();
}

}  // namespace lantern::concurrency
