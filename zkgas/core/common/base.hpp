// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic types and constants.

#include <cstdint>
#include <limits>
#include <string>

namespace zkgas {

using BlockNum = uint64_t;

inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

inline constexpr BlockNum kEarliestBlockNum{0ul};

//! Inclusive range of block numbers [start, end]
struct BlockNumRange {
    BlockNum start;
    BlockNum end;
    BlockNumRange(BlockNum start1, BlockNum end1) : start(start1), end(end1) {}
    friend bool operator==(const BlockNumRange&, const BlockNumRange&) = default;
    BlockNum size() const { return end - start + 1; }
    std::string to_string() const { return std::string("[") + std::to_string(start) + ", " + std::to_string(end) + "]"; }
};

using BlockTime = uint64_t;

inline constexpr uint64_t kGiga{1'000'000'000};  // = 10^9

}  // namespace zkgas
