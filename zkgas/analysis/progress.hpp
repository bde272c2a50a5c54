// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <zkgas/core/common/base.hpp>

namespace zkgas::analysis {

//! Position of the range analysis after one more block has been fetched
struct Progress {
    BlockNum block_num{0};
    uint64_t processed{0};
    uint64_t total{0};

    //! processed / total * 100, shown with one decimal
    double percent() const;

    friend bool operator==(const Progress&, const Progress&) = default;
};

//! Observer of range analysis advancement, notified once after each fetched block
class ProgressSink {
  public:
    virtual ~ProgressSink() = default;

    virtual void report(const Progress& progress) = 0;
};

}  // namespace zkgas::analysis
