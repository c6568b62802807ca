// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

#include <lantern/core/common/base.hpp>

namespace lantern::cl {

//! Get current Unix time in milliseconds
inline uint64_t current_unix_time_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

//! Maps wall-clock time onto beacon chain slots
class SlotClock {
  public:
    using TimeSource = std::function<uint64_t()>;  // Unix time in milliseconds

    SlotClock(uint64_t genesis_time, uint64_t seconds_per_slot, TimeSource now = current_unix_time_ms)
        : genesis_time_ms_{genesis_time * 1000}, slot_duration_ms_{seconds_per_slot * 1000}, now_{std::move(now)} {}

    //! \brief The current slot, zero before genesis
    Slot current_slot() const {
        const auto now = now_();
        if (now < genesis_time_ms_) {
            return 0;
        }
        return (now - genesis_time_ms_) / slot_duration_ms_;
    }

    //! \brief Time left until the start of the next slot
    std::chrono::milliseconds duration_to_next_slot() const {
        const auto now = now_();
        if (now < genesis_time_ms_) {
            return std::chrono::milliseconds{genesis_time_ms_ - now};
        }
        const auto elapsed_in_slot = (now - genesis_time_ms_) % slot_duration_ms_;
        return std::chrono::milliseconds{slot_duration_ms_ - elapsed_in_slot};
    }

    //! \brief Unix time (seconds) at which slot starts
    uint64_t slot_start_time(Slot slot) const { return (genesis_time_ms_ + slot * slot_duration_ms_) / 1000; }

  private:
    uint64_t genesis_time_ms_;
    uint64_t slot_duration_ms_;
    TimeSource now_;
};

}  // namespace lantern::cl
