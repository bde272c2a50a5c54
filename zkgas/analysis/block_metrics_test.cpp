// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_metrics.hpp"

#include <catch2/catch_test_macros.hpp>

namespace zkgas::analysis {

TEST_CASE("round_to", "[zkgas][analysis][block_metrics]") {
    CHECK(round_to(33.333333, 2) == 33.33);
    CHECK(round_to(66.666666, 2) == 66.67);
    CHECK(round_to(0.0, 2) == 0.0);
    CHECK(round_to(2.0004, 3) == 2.0);
    SECTION("exact halves go to the even digit") {
        CHECK(round_to(1.25, 1) == 1.2);
        CHECK(round_to(-1.25, 1) == -1.2);
        CHECK(round_to(0.125, 2) == 0.12);
        CHECK(round_to(2.5, 0) == 2.0);
    }
    SECTION("inexact halves follow the stored binary value") {
        // 0.015 is stored as 0.01499999..., 0.085 as 0.08500000...
        CHECK(round_to(0.015, 2) == 0.01);
        CHECK(round_to(0.085, 2) == 0.09);
        CHECK(round_to(2.675, 2) == 2.67);
    }
}

TEST_CASE("utilization_percent", "[zkgas][analysis][block_metrics]") {
    SECTION("half full block") {
        CHECK(utilization_percent(15'000'000, 30'000'000) == 50.0);
    }
    SECTION("empty block") {
        CHECK(utilization_percent(0, 30'000'000) == 0.0);
    }
    SECTION("full block") {
        CHECK(utilization_percent(30'000'000, 30'000'000) == 100.0);
    }
    SECTION("rounded to two decimals") {
        CHECK(utilization_percent(10'000'000, 30'000'000) == 33.33);
        CHECK(utilization_percent(12'345'678, 30'000'000) == 41.15);
    }
    SECTION("ratios landing on a half cent") {
        CHECK(utilization_percent(4'500, 30'000'000) == 0.01);
        CHECK(utilization_percent(25'500, 30'000'000) == 0.08);
    }
    SECTION("zero gas limit") {
        CHECK(utilization_percent(0, 0) == 0.0);
        CHECK(utilization_percent(21'000, 0) == 0.0);
    }
}

TEST_CASE("make_block_metrics", "[zkgas][analysis][block_metrics]") {
    const auto metrics{make_block_metrics(1'000, 25'000'000'000, 30'000'000, 15'000'000, 1'710'338'135)};
    CHECK(metrics.block_number == 1'000);
    CHECK(metrics.base_fee_wei == 25'000'000'000);
    CHECK(metrics.gas_limit == 30'000'000);
    CHECK(metrics.gas_used == 15'000'000);
    CHECK(metrics.utilization_percent == 50.0);
    CHECK(metrics.timestamp == "2024-03-13T13:55:35Z");
}

TEST_CASE("BlockMetrics to JSON", "[zkgas][analysis][block_metrics]") {
    const auto metrics{make_block_metrics(1'000, 7, 30'000'000, 15'000'000, 0)};
    const nlohmann::json json = metrics;
    CHECK(json == R"({
        "block_number": 1000,
        "base_fee_wei": 7,
        "gas_limit": 30000000,
        "gas_used": 15000000,
        "utilization_percent": 50.0,
        "timestamp": "1970-01-01T00:00:00Z"
    })"_json);
}

}  // namespace zkgas::analysis
