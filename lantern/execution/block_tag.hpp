// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <lantern/core/common/base.hpp>
#include <lantern/lightclient/sync/head_feed.hpp>
#include <lantern/lightclient/types/types.hpp>

namespace lantern::execution {

enum class NamedBlock {
    kLatest,
    kSafe,
    kFinalized,
};

//! Block selector of the JSON-RPC read methods: a named head or an explicit execution block number
using BlockTag = std::variant<NamedBlock, BlockNum>;

//! \brief Parses "latest", "safe", "finalized" or a block number as hex quantity or decimal
//! \remarks "pending" and "earliest" cannot be served from trusted headers and yield std::nullopt
std::optional<BlockTag> parse_block_tag(std::string_view text);

std::string to_string(const BlockTag& tag);

//! Trusted head a named block resolves to
enum class HeadSource {
    kOptimistic,
    kFinalized,
};

struct BlockTagPolicy {
    HeadSource latest{HeadSource::kOptimistic};
    HeadSource safe{HeadSource::kFinalized};
};

//! \brief Selects the trusted header tag refers to within snapshot
//! \throws ExecutionError kHeaderNotSynced without snapshot, kBlockNotAvailable for a number not held
const cl::LightClientHeader& resolve_block_tag(const cl::HeadSnapshot* snapshot, const BlockTag& tag,
                                               const BlockTagPolicy& policy);

}  // namespace lantern::execution
