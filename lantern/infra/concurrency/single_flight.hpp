// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <lantern/infra/concurrency/awaitable_condition_variable.hpp>
#include <lantern/infra/concurrency/task.hpp>

namespace lantern::concurrency {

/**
 * Read-through map of values produced by asynchronous fetches, with at most one fetch in flight per key.
 *
 * Requesters of a key whose fetch is in flight wait for it and share its outcome. Successful results are
 * kept until erased; failures are handed to the waiters of that fetch and then forgotten, so the next
 * request fetches again. A fetch aborted by the cancellation of its requester is not shared: the first
 * waiter to resume starts a new one. When max_size is reached the completed entries are dropped before inserting.
 */
template <typename Key, typename Value>
class SingleFlightMap {
  public:
    using Fetch = std::function<Task<Value>()>;

    explicit SingleFlightMap(size_t max_size) : max_size_{max_size} {}

    // Not copyable nor movable
    SingleFlightMap(const SingleFlightMap&) = delete;
    SingleFlightMap& operator=(const SingleFlightMap&) = delete;

    Task<Value> get(const Key& key, Fetch fetch) {
        std::unique_lock lock{mutex_};
        for (auto it = entries_.find(key); it != entries_.end(); it = entries_.find(key)) {
            auto entry = it->second;
            if (!entry->done) {
                auto waiter = entry->ready.waiter();
                lock.unlock();
                co_await waiter();
                lock.lock();
            }
            // The requester running the fetch was cancelled: take the fetch over
            if (entry->abandoned) {
                continue;
            }
            if (entry->failure) {
                std::rethrow_exception(entry->failure);
            }
            ++hits_;
            co_return *entry->value;
        }

        if (entries_.size() >= max_size_) {
            drop_completed();
        }
        auto entry = std::make_shared<Entry>();
        entries_.emplace(key, entry);
        lock.unlock();

        ++fetches_;
        std::optional<Value> value;
        std::exception_ptr failure;
        try {
            value = co_await fetch();
        } catch (...) {
            failure = std::current_exception();
        }

        lock.lock();
        if (failure) {
            entry->failure = failure;
            entry->abandoned = is_operation_aborted(failure);
            if (auto it = entries_.find(key); it != entries_.end() && it->second == entry) {
                entries_.erase(it);
            }
        } else {
            entry->value = value;
        }
        entry->done = true;
        entry->ready.notify_all();
        lock.unlock();

        if (failure) {
            std::rethrow_exception(failure);
        }
        co_return std::move(*value);
    }

    //! \brief Drops the completed entries whose key satisfies pred, in-flight fetches are left alone
    template <typename Predicate>
    size_t erase_if(Predicate pred) {
        std::scoped_lock lock{mutex_};
        return std::erase_if(entries_, [&](const auto& item) { return item.second->done && pred(item.first); });
    }

    size_t size() const {
        std::scoped_lock lock{mutex_};
        return entries_.size();
    }

    //! Number of fetches started so far
    uint64_t fetches() const { return fetches_; }

    //! Number of requests served by a completed or shared fetch
    uint64_t hits() const { return hits_; }

  private:
    struct Entry {
        bool done{false};
        std::optional<Value> value;
        std::exception_ptr failure;
        //! The fetch was cancelled together with its requester, waiters must not share the outcome
        bool abandoned{false};
        AwaitableConditionVariable ready;
    };

    static bool is_operation_aborted(const std::exception_ptr& failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const boost::system::system_error& se) {
            return se.code() == boost::asio::error::operation_aborted;
        } catch (const std::exception&) {
            return false;
        }
    }

    void drop_completed() {
        std::erase_if(entries_, [](const auto& item) { return item.second->done; });
    }

    size_t max_size_;
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<Entry>> entries_;
    std::atomic<uint64_t> fetches_{0};
    std::atomic<uint64_t> hits_{0};
};

}  // namespace lantern::concurrency
