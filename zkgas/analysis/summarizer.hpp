// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <nlohmann/json.hpp>

#include <zkgas/analysis/block_metrics.hpp>

namespace zkgas::analysis {

//! Aggregate gas statistics over a non-empty sequence of blocks
struct AnalysisSummary {
    double avg_utilization_percent{0.0};
    double max_utilization_percent{0.0};
    double min_utilization_percent{0.0};
    //! Mean base fee in Gwei rounded to 3 decimals
    double avg_base_fee_gwei{0.0};
    uint64_t total_blocks{0};

    friend bool operator==(const AnalysisSummary&, const AnalysisSummary&) = default;
};

//! Result of summarize: std::nullopt is the "no data" outcome for an empty input
using SummaryResult = std::optional<AnalysisSummary>;

//! Reduce the blocks into min/max/average statistics
SummaryResult summarize(std::span<const BlockMetrics> blocks);

void to_json(nlohmann::json& json, const AnalysisSummary& summary);

//! Serialize the summary, mapping the "no data" outcome to {"ok": false, "msg": "No data"}
nlohmann::json summary_to_json(const SummaryResult& summary);

}  // namespace zkgas::analysis
