// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "unix_timestamp.hpp"

#include <catch2/catch_test_macros.hpp>

namespace ferry {

TEST_CASE("unix timestamp conversions", "[ferry][infra][common][unix_timestamp]") {
    const TimePoint tp{time_point_from_unix_timestamp(1'700'000'000)};
    CHECK(unix_timestamp_from_time_point(tp) == 1'700'000'000);
    CHECK(format_rfc3339(tp) == "2023-11-14T22:13:20Z");
    CHECK(format_rfc3339(time_point_from_unix_timestamp(0)) == "1970-01-01T00:00:00Z");
    CHECK(parse_rfc3339("2023-11-14T22:13:20Z") == tp);
    CHECK_THROWS_AS(parse_rfc3339("yesterday"), std::invalid_argument);
}

TEST_CASE("now_seconds drops sub-second precision", "[ferry][infra][common][unix_timestamp]") {
    const TimePoint now{now_seconds()};
    CHECK(time_point_from_unix_timestamp(unix_timestamp_from_time_point(now)) == now);
}

}  // namespace ferry
