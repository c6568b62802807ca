// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

namespace lantern {

// Abseil "Swiss tables", which might not have pointer stability.
// See https://abseil.io/docs/cpp/guides/container#hash-tables

template <class K, class V>
using FlatHashMap = absl::flat_hash_map<K, V>;

template <class T>
using FlatHashSet = absl::flat_hash_set<T>;

}  // namespace lantern
