// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <catch2/catch_test_macros.hpp>

namespace zkgas {

TEST_CASE("Environment", "[zkgas][infra][environment]") {
    const auto saved_rpc_url{Environment::get_rpc_url()};

    SECTION("set/get rpc_url") {
        Environment::set_rpc_url("http://localhost:8545");
        CHECK(Environment::get_rpc_url() == "http://localhost:8545");
    }

    SECTION("empty rpc_url is still set") {
        Environment::set_rpc_url("");
        REQUIRE(Environment::get_rpc_url().has_value());
        CHECK(Environment::get_rpc_url()->empty());
    }

    SECTION("unset rpc_url") {
        Environment::set_rpc_url("http://localhost:8545");
        Environment::unset_rpc_url();
        CHECK(!Environment::get_rpc_url().has_value());
    }

    SECTION("get env var") {
        CHECK(Environment::get("UNEXISTING_ENV_VAR").empty());
        CHECK_FALSE(Environment::get("PATH").empty());
    }

    if (saved_rpc_url) {
        Environment::set_rpc_url(*saved_rpc_url);
    } else {
        Environment::unset_rpc_url();
    }
}

}  // namespace zkgas
