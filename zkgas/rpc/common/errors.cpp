// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <utility>

namespace zkgas::rpc {

HttpStatusError::HttpStatusError(unsigned int status, const std::string& reason)
    : RpcError("HTTP status " + std::to_string(status) + (reason.empty() ? "" : " " + reason)), status_{status} {}

JsonRpcError::JsonRpcError(Error error)
    : RpcError("JSON-RPC error " + std::to_string(error.code) + ": " + error.message), error_{std::move(error)} {}

}  // namespace zkgas::rpc
