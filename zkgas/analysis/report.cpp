// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "report.hpp"

#include <absl/strings/str_format.h>

namespace zkgas::analysis {

void ConsoleProgressSink::report(const Progress& progress) {
    out_ << format_progress(progress) << '\n';
    out_.flush();
}

std::string format_progress(const Progress& progress) {
    return absl::StrFormat("Analyzing block %d (%d/%d, %.1f%% complete)...",
                           progress.block_num, progress.processed, progress.total, progress.percent());
}

void print_header(std::ostream& out, std::string_view rpc_url, uint64_t block_count, std::string_view timestamp_utc) {
    out << kToolName << '\n';
    out << "RPC: " << rpc_url << '\n';
    out << "Blocks to analyze: " << block_count << '\n';
    out << "Timestamp: " << timestamp_utc << '\n';
}

void print_summary(std::ostream& out, const SummaryResult& summary, double elapsed_seconds) {
    out << "\nSummary:\n";
    if (!summary) {
        out << "  - No data\n";
    } else {
        out << absl::StrFormat("  - Avg Utilization: %.2f%%\n", summary->avg_utilization_percent);
        out << absl::StrFormat("  - Max Utilization: %.2f%%\n", summary->max_utilization_percent);
        out << absl::StrFormat("  - Min Utilization: %.2f%%\n", summary->min_utilization_percent);
        out << absl::StrFormat("  - Avg Base Fee: %.3f Gwei\n", summary->avg_base_fee_gwei);
        out << absl::StrFormat("  - Blocks Analyzed: %d\n", summary->total_blocks);
    }
    out << absl::StrFormat("Completed in %.2fs\n", elapsed_seconds);
}

void print_error(std::ostream& out, std::string_view message) {
    out << "Error: " << message << '\n';
}

nlohmann::json make_json_report(std::string_view rpc_url, std::string_view timestamp_utc,
                                std::span<const BlockMetrics> blocks, const SummaryResult& summary,
                                double elapsed_seconds) {
    nlohmann::json report;
    report["rpc"] = rpc_url;
    report["timestamp_utc"] = timestamp_utc;
    report["blocks"] = nlohmann::json::array();
    for (const auto& block : blocks) {
        report["blocks"].push_back(block);
    }
    report["summary"] = summary_to_json(summary);
    report["elapsed_seconds"] = elapsed_seconds;
    return report;
}

}  // namespace zkgas::analysis
