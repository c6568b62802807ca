// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_tag.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>

#include <lantern/core/common/overloaded.hpp>
#include <lantern/core/common/util.hpp>
#include <lantern/execution/errors.hpp>

namespace lantern::execution {

std::optional<BlockTag> parse_block_tag(std::string_view text) {
    const std::string tag{absl::AsciiStrToLower(text)};
    if (tag == "latest") {
        return NamedBlock::kLatest;
    }
    if (tag == "safe") {
        return NamedBlock::kSafe;
    }
    if (tag == "finalized") {
        return NamedBlock::kFinalized;
    }
    BlockNum number{0};
    if (has_hex_prefix(tag)) {
        if (tag.size() > 2 && absl::SimpleHexAtoi(std::string_view{tag}.substr(2), &number)) {
            return number;
        }
        return std::nullopt;
    }
    if (absl::SimpleAtoi(tag, &number)) {
        return number;
    }
    return std::nullopt;
}

std::string to_string(const BlockTag& tag) {
    return std::visit(Overloaded{
                          [](NamedBlock named) -> std::string {
                              switch (named) {
                                  case NamedBlock::kLatest:
                                      return "latest";
                                  case NamedBlock::kSafe:
                                      return "safe";
                                  case NamedBlock::kFinalized:
                                      return "finalized";
                              }
                              return "";
                          },
                          [](BlockNum number) { return std::to_string(number); },
                      },
                      tag);
}

static const cl::LightClientHeader& head(const cl::HeadSnapshot& snapshot, HeadSource source) {
    return source == HeadSource::kFinalized ? snapshot.finalized : snapshot.optimistic;
}

const cl::LightClientHeader& resolve_block_tag(const cl::HeadSnapshot* snapshot, const BlockTag& tag,
                                               const BlockTagPolicy& policy) {
    if (!snapshot) {
        throw ExecutionError{ExecutionErrorCode::kHeaderNotSynced, "no trusted head yet"};
    }
    if (const auto* named = std::get_if<NamedBlock>(&tag)) {
        switch (*named) {
            case NamedBlock::kLatest:
                return head(*snapshot, policy.latest);
            case NamedBlock::kSafe:
                return head(*snapshot, policy.safe);
            case NamedBlock::kFinalized:
                return snapshot->finalized;
        }
    }
    const BlockNum number{std::get<BlockNum>(tag)};
    const cl::LightClientHeader* header = snapshot->find_by_block_number(number);
    if (!header) {
        throw ExecutionError{ExecutionErrorCode::kBlockNotAvailable,
                             "block " + std::to_string(number) + " is not among the trusted headers"};
    }
    return *header;
}

}  // namespace lantern::execution
