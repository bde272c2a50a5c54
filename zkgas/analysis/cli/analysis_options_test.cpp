// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "analysis_options.hpp"

#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <zkgas/infra/common/environment.hpp>

namespace zkgas::cmd::common {

using namespace std::chrono_literals;

//! Restore the RPC_URL environment variable on scope exit
class RpcUrlGuard {
  public:
    RpcUrlGuard() : saved_rpc_url_{Environment::get_rpc_url()} {}
    ~RpcUrlGuard() {
        if (saved_rpc_url_) {
            Environment::set_rpc_url(*saved_rpc_url_);
        } else {
            Environment::unset_rpc_url();
        }
    }

  private:
    std::optional<std::string> saved_rpc_url_;
};

TEST_CASE("add_analysis_options", "[zkgas][cli][analysis]") {
    RpcUrlGuard rpc_url_guard;
    CLI::App cli{"test"};
    analysis::Settings settings;

    SECTION("defaults without RPC_URL") {
        Environment::unset_rpc_url();
        add_analysis_options(cli, settings);
        cli.parse("");
        CHECK(settings.rpc_url == rpc::kDefaultRpcUrl);
        CHECK(settings.block_count == 10);
        CHECK(!settings.json_output);
        CHECK(settings.timeout == 30s);
    }

    SECTION("RPC_URL is the default endpoint") {
        Environment::set_rpc_url("http://archive.local:8545");
        add_analysis_options(cli, settings);
        cli.parse("");
        CHECK(settings.rpc_url == "http://archive.local:8545");
    }

    SECTION("empty RPC_URL is kept and left to the runner") {
        Environment::set_rpc_url("");
        add_analysis_options(cli, settings);
        cli.parse("");
        CHECK(settings.rpc_url.empty());
    }

    SECTION("explicit options override defaults") {
        Environment::set_rpc_url("http://archive.local:8545");
        add_analysis_options(cli, settings);
        cli.parse("--rpc https://rpc.example.org --count 25 --json --timeout 5");
        CHECK(settings.rpc_url == "https://rpc.example.org");
        CHECK(settings.block_count == 25);
        CHECK(settings.json_output);
        CHECK(settings.timeout == 5s);
    }

    SECTION("malformed URL is left to the runner") {
        add_analysis_options(cli, settings);
        CHECK_NOTHROW(cli.parse("--rpc ftp://x"));
        CHECK(settings.rpc_url == "ftp://x");
    }

    SECTION("invalid count") {
        add_analysis_options(cli, settings);
        CHECK_THROWS_AS(cli.parse("--count 0"), CLI::ValidationError);
        CHECK_THROWS_AS(cli.parse("--count -3"), CLI::ParseError);
    }

    SECTION("invalid timeout") {
        add_analysis_options(cli, settings);
        CHECK_THROWS_AS(cli.parse("--timeout 0"), CLI::ValidationError);
        CHECK_THROWS_AS(cli.parse("--timeout 100000"), CLI::ValidationError);
    }
}

}  // namespace zkgas::cmd::common
