// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>

#include <CLI/CLI.hpp>

#include <zkgas/analysis/cli/analysis_options.hpp>
#include <zkgas/analysis/runner.hpp>
#include <zkgas/analysis/settings.hpp>
#include <zkgas/infra/cli/common.hpp>
#include <zkgas/infra/common/log.hpp>

using namespace zkgas;
using namespace zkgas::cmd::common;

struct Settings {
    log::Settings log_settings;
    analysis::Settings analysis_settings;
};

Settings zkgas_parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"zk-gas-soundness - analyze recent block gas usage, base fee and utilization"};

    Settings settings;
    add_logging_options(cli, settings.log_settings);
    add_analysis_options(cli, settings.analysis_settings);

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }

    return settings;
}

int zkgas_main(const Settings& settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main");

    analysis::Runner runner{settings.analysis_settings, analysis::make_http_node_client, std::cout};
    return static_cast<int>(runner.run());
}

int main(int argc, char* argv[]) {
    try {
        return zkgas_main(zkgas_parse_cli_settings(argc, argv));
    } catch (const CLI::ParseError& pe) {
        return pe.get_exit_code();
    } catch (const std::exception& e) {
        ZKGAS_CRIT << "zkgas exiting due to exception: " << e.what();
        std::cout << "Error: " << e.what() << '\n';
        return static_cast<int>(analysis::ExitCode::kAnalysisFailure);
    }
}
