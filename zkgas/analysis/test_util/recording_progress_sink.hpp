// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <zkgas/analysis/progress.hpp>

namespace zkgas::analysis::test_util {

//! ProgressSink keeping every notification for later inspection
class RecordingProgressSink : public ProgressSink {
  public:
    void report(const Progress& progress) override { reports_.push_back(progress); }

    const std::vector<Progress>& reports() const { return reports_; }

  private:
    std::vector<Progress> reports_;
};

}  // namespace zkgas::analysis::test_util
