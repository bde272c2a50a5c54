// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <zkgas/analysis/settings.hpp>

namespace zkgas::cmd::common {

//! Set up the options of the gas analysis run, --rpc defaults to the RPC_URL environment variable
void add_analysis_options(CLI::App& cli, analysis::Settings& settings);

}  // namespace zkgas::cmd::common
