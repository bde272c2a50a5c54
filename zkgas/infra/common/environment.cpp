// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <boost/process/environment.hpp>

namespace zkgas {

std::optional<std::string> Environment::get_rpc_url() {
    std::optional<std::string> rpc_url;
    auto environment = boost::this_process::environment();
    // A variable set to the empty string is still set
    const auto env_var = environment.find(std::string{kRpcUrlEnvVar});
    if (env_var != environment.end()) {
        rpc_url = env_var->to_string();
    }
    return rpc_url;
}

void Environment::set_rpc_url(std::string_view rpc_url) {
    auto environment = boost::this_process::environment();
    environment[std::string{kRpcUrlEnvVar}] = std::string{rpc_url};
}

void Environment::unset_rpc_url() {
    auto environment = boost::this_process::environment();
    environment.erase(std::string{kRpcUrlEnvVar});
}

std::string Environment::get(std::string_view var_name) {
    auto environment = boost::this_process::environment();
    const auto env_var = environment[std::string{var_name}];
    return env_var.to_string();
}

}  // namespace zkgas
