// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>

#include <lantern/infra/concurrency/task.hpp>

namespace lantern::concurrency {

class AwaitableConditionVariableImpl;

/**
 * A condition variable for coroutines supporting multiple waiters.
 *
 * Take the waiter while holding the lock guarding the producer state, then release the lock and co_await it:
 * a notify_all() happening in between wakes the waiter up immediately instead of being lost.
 *
 *     // consumer
 *     std::unique_lock lock{mutex_};
 *     if (ready_) co_return;
 *     auto waiter = cond_var.waiter();
 *     lock.unlock();
 *     co_await waiter();
 *
 *     // producer
 *     std::scoped_lock lock{mutex_};
 *     ready_ = true;
 *     cond_var.notify_all();
 */
class AwaitableConditionVariable {
  public:
    AwaitableConditionVariable();
    ~AwaitableConditionVariable();

    using Waiter = std::function<Task<void>()>;

    Waiter waiter();
    void notify_all();

  private:
    std::unique_ptr<AwaitableConditionVariableImpl> p_impl_;
};

}  // namespace lantern::concurrency
