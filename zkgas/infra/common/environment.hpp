// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace zkgas {

//! Name of the variable holding the default JSON-RPC endpoint
inline constexpr std::string_view kRpcUrlEnvVar{"RPC_URL"};

class Environment {
  public:
    //! The JSON-RPC endpoint configured through the process environment, if any (possibly empty)
    static std::optional<std::string> get_rpc_url();
    static void set_rpc_url(std::string_view rpc_url);
    static void unset_rpc_url();

    static std::string get(std::string_view var_name);
};

}  // namespace zkgas
