// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "report.hpp"

#include <sstream>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace zkgas::analysis {

static const AnalysisSummary kSummary{
    .avg_utilization_percent = 20.0,
    .max_utilization_percent = 30.0,
    .min_utilization_percent = 10.0,
    .avg_base_fee_gwei = 2.0,
    .total_blocks = 3,
};

TEST_CASE("format_progress", "[zkgas][analysis][report]") {
    CHECK(format_progress(Progress{.block_num = 998, .processed = 1, .total = 3}) ==
          "Analyzing block 998 (1/3, 33.3% complete)...");
    CHECK(format_progress(Progress{.block_num = 1'000, .processed = 3, .total = 3}) ==
          "Analyzing block 1000 (3/3, 100.0% complete)...");
}

TEST_CASE("ConsoleProgressSink", "[zkgas][analysis][report]") {
    std::ostringstream out;
    ConsoleProgressSink sink{out};
    sink.report(Progress{.block_num = 41, .processed = 1, .total = 2});
    sink.report(Progress{.block_num = 42, .processed = 2, .total = 2});
    CHECK(out.str() ==
          "Analyzing block 41 (1/2, 50.0% complete)...\n"
          "Analyzing block 42 (2/2, 100.0% complete)...\n");
}

TEST_CASE("print_header", "[zkgas][analysis][report]") {
    std::ostringstream out;
    print_header(out, "http://localhost:8545", 10, "2024-03-13T13:55:35.000000Z");
    CHECK(out.str() ==
          "zk-gas-soundness\n"
          "RPC: http://localhost:8545\n"
          "Blocks to analyze: 10\n"
          "Timestamp: 2024-03-13T13:55:35.000000Z\n");
}

TEST_CASE("print_summary", "[zkgas][analysis][report]") {
    std::ostringstream out;

    SECTION("statistics") {
        print_summary(out, kSummary, 1.234);
        CHECK(out.str() ==
              "\nSummary:\n"
              "  - Avg Utilization: 20.00%\n"
              "  - Max Utilization: 30.00%\n"
              "  - Min Utilization: 10.00%\n"
              "  - Avg Base Fee: 2.000 Gwei\n"
              "  - Blocks Analyzed: 3\n"
              "Completed in 1.23s\n");
    }

    SECTION("no data") {
        print_summary(out, std::nullopt, 0.0);
        CHECK(out.str() ==
              "\nSummary:\n"
              "  - No data\n"
              "Completed in 0.00s\n");
    }
}

TEST_CASE("print_error", "[zkgas][analysis][report]") {
    std::ostringstream out;
    print_error(out, "block 0x3e8 not found");
    CHECK(out.str() == "Error: block 0x3e8 not found\n");
}

TEST_CASE("make_json_report", "[zkgas][analysis][report]") {
    const std::vector<BlockMetrics> blocks{
        make_block_metrics(999, 1'000'000'000, 30'000'000, 3'000'000, 0),
        make_block_metrics(1'000, 3'000'000'000, 30'000'000, 9'000'000, 12),
    };

    SECTION("with summary") {
        const auto report{make_json_report("http://localhost:8545", "2024-03-13T13:55:35.000000Z", blocks, kSummary, 0.5)};
        CHECK(report["rpc"] == "http://localhost:8545");
        CHECK(report["timestamp_utc"] == "2024-03-13T13:55:35.000000Z");
        REQUIRE(report["blocks"].size() == 2);
        CHECK(report["blocks"][0]["block_number"] == 999);
        CHECK(report["blocks"][0]["utilization_percent"] == 10.0);
        CHECK(report["blocks"][1]["timestamp"] == "1970-01-01T00:00:12Z");
        CHECK(report["summary"]["total_blocks"] == 3);
        CHECK(report["summary"]["avg_base_fee_gwei"] == 2.0);
        CHECK(report["elapsed_seconds"] == 0.5);
    }

    SECTION("without data") {
        const auto report{make_json_report("http://localhost:8545", "2024-03-13T13:55:35.000000Z", {}, std::nullopt, 0.0)};
        CHECK(report["blocks"] == nlohmann::json::array());
        CHECK(report["summary"] == R"({"ok": false, "msg": "No data"})"_json);
    }
}

}  // namespace zkgas::analysis
