// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string_view>

namespace zkgas::rpc {

// Constants defined here have a different naming from our standard: k_<JSON_RPC_API>
// where <JSON_RPC_API> is *exactly* the JSON RPC API method
namespace method {
    inline constexpr const char* k_web3_clientVersion{"web3_clientVersion"};
    inline constexpr const char* k_eth_blockNumber{"eth_blockNumber"};
    inline constexpr const char* k_eth_getBlockByNumber{"eth_getBlockByNumber"};
}  // namespace method

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

inline constexpr std::string_view kHttpScheme{"http"};
inline constexpr std::string_view kHttpsScheme{"https"};
inline constexpr std::string_view kDefaultHttpPort{"80"};
inline constexpr std::string_view kDefaultHttpsPort{"443"};

inline constexpr std::string_view kDefaultRpcUrl{"https://mainnet.infura.io/v3/YOUR_INFURA_KEY"};
inline constexpr std::chrono::seconds kDefaultTimeout{30};

inline constexpr std::string_view kUserAgent{"zkgas/1.0"};

}  // namespace zkgas::rpc
