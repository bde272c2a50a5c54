// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "analysis_options.hpp"

#include <cstdint>
#include <string>

#include <zkgas/infra/common/environment.hpp>
#include <zkgas/rpc/common/constants.hpp>

namespace zkgas::cmd::common {

//! Upper bound for the per-call timeout, one day is more than any node needs
static constexpr uint32_t kMaxTimeoutSeconds{86'400};

void add_analysis_options(CLI::App& cli, analysis::Settings& settings) {
    // URL format is checked by the runner before any network activity
    settings.rpc_url = Environment::get_rpc_url().value_or(std::string{rpc::kDefaultRpcUrl});
    cli.add_option("--rpc", settings.rpc_url)
        ->description("JSON-RPC endpoint URL (default: env " + std::string{kRpcUrlEnvVar} + " or Infura)")
        ->capture_default_str();

    cli.add_option("--count", settings.block_count)
        ->description("Number of recent blocks to analyze")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    cli.add_flag("--json", settings.json_output)
        ->description("Also output the full analysis as JSON")
        ->capture_default_str();

    cli.add_option_function<uint32_t>(
           "--timeout",
           [&settings](const uint32_t& timeout_seconds) {
               settings.timeout = std::chrono::seconds{timeout_seconds};
           })
        ->description("RPC timeout in seconds")
        ->check(CLI::Range(uint32_t{1}, kMaxTimeoutSeconds))
        ->default_val(static_cast<uint32_t>(rpc::kDefaultTimeout.count()));
}

}  // namespace zkgas::cmd::common
