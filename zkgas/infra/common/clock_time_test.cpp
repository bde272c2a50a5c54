// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "clock_time.hpp"

#include <catch2/catch_test_macros.hpp>

namespace zkgas::clock_time {

TEST_CASE("to_iso8601_utc", "[zkgas][infra][clock_time]") {
    CHECK(to_iso8601_utc(0) == "1970-01-01T00:00:00Z");
    CHECK(to_iso8601_utc(1'704'067'200) == "2024-01-01T00:00:00Z");
    CHECK(to_iso8601_utc(1'710'338'135) == "2024-03-13T13:55:35Z");
}

TEST_CASE("now_iso8601_utc", "[zkgas][infra][clock_time]") {
    const std::string timestamp{now_iso8601_utc()};
    // YYYY-MM-DDTHH:MM:SS.ffffffZ
    REQUIRE(timestamp.size() == 27);
    CHECK(timestamp[4] == '-');
    CHECK(timestamp[10] == 'T');
    CHECK(timestamp[19] == '.');
    CHECK(timestamp.back() == 'Z');
}

}  // namespace zkgas::clock_time
