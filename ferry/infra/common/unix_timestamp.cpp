// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "unix_timestamp.hpp"

#include <stdexcept>

#include <absl/time/time.h>

namespace ferry {

//! Always rendered in UTC, so the offset is spelled as the Zulu designator
static constexpr const char* kRfc3339UtcFormat{"%Y-%m-%d%ET%H:%M:%SZ"};

uint64_t unix_timestamp_from_time_point(TimePoint time_point) {
    const auto seconds{std::chrono::duration_cast<std::chrono::seconds>(time_point.time_since_epoch())};
    return static_cast<uint64_t>(seconds.count());
}

TimePoint time_point_from_unix_timestamp(uint64_t timestamp) {
    return TimePoint{std::chrono::seconds(timestamp)};
}

TimePoint now_seconds() {
    return time_point_from_unix_timestamp(unix_timestamp_from_time_point(std::chrono::system_clock::now()));
}

std::string format_rfc3339(TimePoint time_point) {
    return absl::FormatTime(kRfc3339UtcFormat, absl::FromChrono(time_point), absl::UTCTimeZone());
}

TimePoint parse_rfc3339(const std::string& text) {
    absl::Time time;
    std::string error;
    if (!absl::ParseTime(absl::RFC3339_full, text, &time, &error)) {
        throw std::invalid_argument("Invalid timestamp '" + text + "': " + error);
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(absl::ToChronoTime(time));
}

}  // namespace ferry
