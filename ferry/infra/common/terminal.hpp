// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <string_view>

namespace ferry {

//! ANSI escape sequences used to paint log lines
namespace color {
    inline constexpr std::string_view kReset = "\x1b[0m";
    inline constexpr std::string_view kGrey = "\x1b[90m";
    inline constexpr std::string_view kWhite = "\x1b[97m";
    inline constexpr std::string_view kRed = "\x1b[91m";
    inline constexpr std::string_view kGreen = "\x1b[32m";
    inline constexpr std::string_view kYellow = "\x1b[1;33m";
    inline constexpr std::string_view kCyan = "\x1b[36m";
    inline constexpr std::string_view kRedBackground = "\x1b[101m";
}  // namespace color

//! Check if the stream is attached to a TTY terminal
bool is_terminal(std::FILE* stream);

}  // namespace ferry
