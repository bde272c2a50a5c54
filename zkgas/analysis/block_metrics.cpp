// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_metrics.hpp"

#include <stdexcept>
#include <string>

#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

#include <zkgas/infra/common/clock_time.hpp>

namespace zkgas::analysis {

double round_to(double value, int decimals) {
    // printf conversion rounds the exact binary value, ties going to even
    const std::string text{absl::StrFormat("%.*f", decimals, value)};
    double rounded{0.0};
    if (!absl::SimpleAtod(text, &rounded)) {
        throw std::logic_error{"round_to: cannot parse back " + text};
    }
    return rounded;
}

double utilization_percent(uint64_t gas_used, uint64_t gas_limit) {
    if (gas_limit == 0) {
        return 0.0;
    }
    return round_to(static_cast<double>(gas_used) / static_cast<double>(gas_limit) * 100.0, 2);
}

BlockMetrics make_block_metrics(BlockNum block_number, uint64_t base_fee_wei, uint64_t gas_limit,
                                uint64_t gas_used, BlockTime unix_timestamp) {
    return BlockMetrics{
        .block_number = block_number,
        .base_fee_wei = base_fee_wei,
        .gas_limit = gas_limit,
        .gas_used = gas_used,
        .utilization_percent = utilization_percent(gas_used, gas_limit),
        .timestamp = clock_time::to_iso8601_utc(unix_timestamp),
    };
}

void to_json(nlohmann::json& json, const BlockMetrics& metrics) {
    json["block_number"] = metrics.block_number;
    json["base_fee_wei"] = metrics.base_fee_wei;
    json["gas_limit"] = metrics.gas_limit;
    json["gas_used"] = metrics.gas_used;
    json["utilization_percent"] = metrics.utilization_percent;
    json["timestamp"] = metrics.timestamp;
}

}  // namespace zkgas::analysis
