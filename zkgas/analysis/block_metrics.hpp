// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include <zkgas/core/common/base.hpp>

namespace zkgas::analysis {

//! Gas figures of one block as observed from the node
struct BlockMetrics {
    BlockNum block_number{0};
    //! Zero on chains without fee market
    uint64_t base_fee_wei{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    //! gas_used / gas_limit * 100 rounded to 2 decimals, zero if gas_limit is zero
    double utilization_percent{0.0};
    //! Block time as UTC ISO-8601, e.g. 2024-03-13T13:55:35Z
    std::string timestamp;

    friend bool operator==(const BlockMetrics&, const BlockMetrics&) = default;
};

//! Round to the given number of decimal digits, exact halves of the binary value go to the even digit
double round_to(double value, int decimals);

double utilization_percent(uint64_t gas_used, uint64_t gas_limit);

BlockMetrics make_block_metrics(BlockNum block_number, uint64_t base_fee_wei, uint64_t gas_limit,
                                uint64_t gas_used, BlockTime unix_timestamp);

void to_json(nlohmann::json& json, const BlockMetrics& metrics);

}  // namespace zkgas::analysis
