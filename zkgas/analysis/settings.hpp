// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <zkgas/rpc/common/constants.hpp>

namespace zkgas::analysis {

inline constexpr uint64_t kDefaultBlockCount{10};

//! Configuration of one analysis run, read once at startup
struct Settings {
    //! JSON-RPC endpoint, must be http:// or https://
    std::string rpc_url{rpc::kDefaultRpcUrl};
    //! Number of most recent blocks to analyze
    uint64_t block_count{kDefaultBlockCount};
    //! Whether to emit the JSON document after the text summary
    bool json_output{false};
    //! Timeout applied to every single RPC call
    std::chrono::seconds timeout{rpc::kDefaultTimeout};
};

}  // namespace zkgas::analysis
