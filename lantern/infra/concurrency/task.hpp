// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

// Plain lantern namespace so that coroutines everywhere can return Task<T>
namespace lantern {

//! Asynchronous task returned by any coroutine, i.e. asynchronous operation
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace lantern
