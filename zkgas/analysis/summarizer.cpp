// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "summarizer.hpp"

#include <algorithm>

#include <absl/numeric/int128.h>

#include <zkgas/core/common/base.hpp>

namespace zkgas::analysis {

SummaryResult summarize(std::span<const BlockMetrics> blocks) {
    if (blocks.empty()) {
        return std::nullopt;
    }

    double utilization_sum{0.0};
    absl::uint128 base_fee_sum{0};
    double max_utilization{blocks.front().utilization_percent};
    double min_utilization{blocks.front().utilization_percent};
    for (const auto& block : blocks) {
        utilization_sum += block.utilization_percent;
        base_fee_sum += block.base_fee_wei;
        max_utilization = std::max(max_utilization, block.utilization_percent);
        min_utilization = std::min(min_utilization, block.utilization_percent);
    }
    const auto count{static_cast<double>(blocks.size())};

    // Mean of values already rounded to 2 decimals may exceed the bounds by rounding error only
    const double avg_utilization{std::clamp(round_to(utilization_sum / count, 2), min_utilization, max_utilization)};

    return AnalysisSummary{
        .avg_utilization_percent = avg_utilization,
        .max_utilization_percent = round_to(max_utilization, 2),
        .min_utilization_percent = round_to(min_utilization, 2),
        .avg_base_fee_gwei = round_to(static_cast<double>(base_fee_sum) / count / static_cast<double>(kGiga), 3),
        .total_blocks = blocks.size(),
    };
}

void to_json(nlohmann::json& json, const AnalysisSummary& summary) {
    json["avg_utilization_percent"] = summary.avg_utilization_percent;
    json["max_utilization_percent"] = summary.max_utilization_percent;
    json["min_utilization_percent"] = summary.min_utilization_percent;
    json["avg_base_fee_gwei"] = summary.avg_base_fee_gwei;
    json["total_blocks"] = summary.total_blocks;
}

nlohmann::json summary_to_json(const SummaryResult& summary) {
    if (!summary) {
        return nlohmann::json{{"ok", false}, {"msg", "No data"}};
    }
    return nlohmann::json(*summary);
}

}  // namespace zkgas::analysis
