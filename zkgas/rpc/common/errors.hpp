// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <zkgas/rpc/types/error.hpp>

namespace zkgas::rpc {

//! The JSON-RPC endpoint URL is malformed or uses an unsupported scheme
class ConfigurationError : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

//! Base class for failures of a JSON-RPC exchange which completed at transport level
class RpcError : public std::runtime_error {
  public:
    explicit RpcError(const std::string& message) : std::runtime_error(message) {}
};

//! The node answered with a non-successful HTTP status
class HttpStatusError : public RpcError {
  public:
    HttpStatusError(unsigned int status, const std::string& reason);

    unsigned int status() const noexcept { return status_; }

  private:
    unsigned int status_;
};

//! The node answered with a JSON-RPC error object
class JsonRpcError : public RpcError {
  public:
    explicit JsonRpcError(Error error);

    const Error& error() const noexcept { return error_; }

  private:
    Error error_;
};

//! The node answered with a payload which is not a well-formed JSON-RPC response
class InvalidResponseError : public RpcError {
  public:
    explicit InvalidResponseError(const std::string& message) : RpcError("invalid JSON-RPC response: " + message) {}
};

}  // namespace zkgas::rpc
