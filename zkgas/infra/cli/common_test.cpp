// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <catch2/catch_test_macros.hpp>

namespace zkgas::cmd::common {

TEST_CASE("add_logging_options", "[zkgas][cli][log]") {
    CLI::App cli{"test"};
    log::Settings settings;
    add_logging_options(cli, settings);

    SECTION("defaults") {
        cli.parse("");
        CHECK(settings.log_verbosity == log::Level::kWarning);
        CHECK(!settings.log_std_out);
        CHECK(!settings.log_nocolor);
        CHECK(settings.log_file.empty());
    }

    SECTION("verbosity by name") {
        cli.parse("--log.verbosity debug");
        CHECK(settings.log_verbosity == log::Level::kDebug);
    }

    SECTION("verbosity by name ignoring case") {
        cli.parse("--log.verbosity TRACE");
        CHECK(settings.log_verbosity == log::Level::kTrace);
    }

    SECTION("flags and file") {
        cli.parse("--log.stdout --log.nocolor --log.threads --log.file zkgas.log");
        CHECK(settings.log_std_out);
        CHECK(settings.log_nocolor);
        CHECK(settings.log_threads);
        CHECK(settings.log_file == "zkgas.log");
    }

    SECTION("unknown verbosity") {
        CHECK_THROWS_AS(cli.parse("--log.verbosity chatty"), CLI::ValidationError);
    }
}

}  // namespace zkgas::cmd::common
