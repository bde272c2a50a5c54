// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

namespace zkgas::cmd::common {

static const std::map<std::string, log::Level>& verbosity_by_name() {
    static const std::map<std::string, log::Level> kVerbosityByName{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    return kVerbosityByName;
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    auto& group = *cli.add_option_group("Log", "Diagnostic logging, the analysis report itself always goes to stdout");
    group.add_option("--log.verbosity", log_settings.log_verbosity, "Log verbosity: critical, error, warning, info, debug, trace")
        ->transform(CLI::CheckedTransformer(verbosity_by_name(), CLI::ignore_case))
        ->default_val(log::Level::kWarning);
    group.add_flag("--log.stdout", log_settings.log_std_out, "Write log lines to stdout instead of stderr");
    group.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors in log lines");
    group.add_flag("--log.utc", log_settings.log_utc, "Print log timestamps in UTC");
    group.add_flag("--log.threads", log_settings.log_threads, "Print thread names in log lines");
    group.add_option("--log.file", log_settings.log_file, "Append log lines to the given file as well");
}

}  // namespace zkgas::cmd::common
