// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <lantern/infra/concurrency/task.hpp>

namespace lantern {

//! Suspends the calling coroutine for the given duration; cancellation aborts the wait with operation_aborted
Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace lantern
