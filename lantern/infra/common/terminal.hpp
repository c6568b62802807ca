// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace lantern {

inline constexpr std::string_view kColorReset = "\x1b[0m";  // Resets fore color to terminal default

inline constexpr std::string_view kColorCoal = "\x1b[90m";        // Black
inline constexpr std::string_view kColorWhite = "\x1b[97m";       // White
inline constexpr std::string_view kColorRed = "\x1b[91m";         // Red
inline constexpr std::string_view kColorGreen = "\x1b[32m";       // Green
inline constexpr std::string_view kColorOrangeHigh = "\x1b[1;33m";  // Yellow
inline constexpr std::string_view kColorTeal = "\x1b[36m";        // Cyan

inline constexpr std::string_view kBackgroundPurple = "\x1b[105m";  // Purple
inline constexpr std::string_view kBackgroundRed = "\x1b[101m";     // Red

bool is_terminal_stdout();

bool is_terminal_stderr();

}  // namespace lantern
