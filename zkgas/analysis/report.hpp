// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <zkgas/analysis/block_metrics.hpp>
#include <zkgas/analysis/progress.hpp>
#include <zkgas/analysis/summarizer.hpp>

namespace zkgas::analysis {

inline constexpr std::string_view kToolName{"zk-gas-soundness"};

//! ProgressSink printing one line per analyzed block
class ConsoleProgressSink : public ProgressSink {
  public:
    explicit ConsoleProgressSink(std::ostream& out) : out_{out} {}

    void report(const Progress& progress) override;

  private:
    std::ostream& out_;
};

std::string format_progress(const Progress& progress);

//! Print the banner: tool name, endpoint, block count and start time
void print_header(std::ostream& out, std::string_view rpc_url, uint64_t block_count, std::string_view timestamp_utc);

//! Print the human-readable statistics followed by the elapsed time
void print_summary(std::ostream& out, const SummaryResult& summary, double elapsed_seconds);

//! Print a fatal error in the user-facing format
void print_error(std::ostream& out, std::string_view message);

//! Build the machine-readable document of the whole run
nlohmann::json make_json_report(std::string_view rpc_url, std::string_view timestamp_utc,
                                std::span<const BlockMetrics> blocks, const SummaryResult& summary,
                                double elapsed_seconds);

}  // namespace zkgas::analysis
