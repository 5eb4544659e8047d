// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ferry {

using TimePoint = std::chrono::time_point<std::chrono::system_clock>;

uint64_t unix_timestamp_from_time_point(TimePoint time_point);
TimePoint time_point_from_unix_timestamp(uint64_t timestamp);

//! Current wall-clock time truncated to whole seconds, as stored in the ledger
TimePoint now_seconds();

//! RFC 3339 UTC rendering of a time point (e.g. 2025-01-31T10:00:00Z)
std::string format_rfc3339(TimePoint time_point);

//! Parses an RFC 3339 timestamp as produced by format_rfc3339
//! \throws std::invalid_argument on malformed input
TimePoint parse_rfc3339(const std::string& text);

}  // namespace ferry
