// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <sstream>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <lantern/infra/test_util/log.hpp>

namespace lantern::log {

//! LogBuffer exposing its buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

TEST_CASE("LogBuffer", "[infra][common][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    init(Settings{.log_verbosity = Level::kInfo});

    SECTION("nothing is buffered above the verbosity") {
        LogBufferForTest<Level::kDebug> debug_buffer;
        debug_buffer << "test";
        CHECK(debug_buffer.content().empty());
        LogBufferForTest<Level::kTrace> trace_buffer;
        trace_buffer << "test";
        CHECK(trace_buffer.content().empty());
    }

    SECTION("content is buffered at or below the verbosity") {
        LogBufferForTest<Level::kInfo> info_buffer;
        info_buffer << "test";
        CHECK(absl::StrContains(info_buffer.content(), "test"));
        LogBufferForTest<Level::kError> error_buffer;
        error_buffer << "test";
        CHECK(absl::StrContains(error_buffer.content(), "test"));
    }

    SECTION("arguments are printed as key=value pairs") {
        LogBufferForTest<Level::kInfo> buffer{"[LightClient] Head advanced", {"slot", "42", "period", "0"}};
        const auto content = buffer.content();
        CHECK(absl::StrContains(content, "[LightClient] Head advanced"));
        CHECK(absl::StrContains(content, "slot"));
        CHECK(absl::StrContains(content, "42"));
    }

    SECTION("flushed lines reach the configured stream") {
        { Info{"flushed line"}; }
        CHECK(absl::StrContains(string_cerr.str(), "flushed line"));
        CHECK(string_cout.str().empty());
    }
}

TEST_CASE("level_from_string", "[infra][common][log]") {
    CHECK(level_from_string("info") == Level::kInfo);
    CHECK(level_from_string("WARNING") == Level::kWarning);
    CHECK(level_from_string("warn") == Level::kWarning);
    CHECK(level_from_string("5") == Level::kDebug);
    CHECK(level_from_string("0") == Level::kNone);
    CHECK_FALSE(level_from_string("loud"));
    CHECK_FALSE(level_from_string("42"));
}

}  // namespace lantern::log
