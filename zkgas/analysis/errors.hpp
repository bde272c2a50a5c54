// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <zkgas/core/common/base.hpp>

namespace zkgas::analysis {

//! The initial liveness check against the node failed
class ConnectivityError : public std::runtime_error {
  public:
    explicit ConnectivityError(const std::string& message) : std::runtime_error(message) {}
};

//! Any failure while fetching blocks: unreachable node, timeout, unknown block, malformed response
class RemoteFetchError : public std::runtime_error {
  public:
    explicit RemoteFetchError(const std::string& message) : std::runtime_error(message) {}
};

//! The requested number of blocks goes past the genesis block
class InvalidRangeError : public std::out_of_range {
  public:
    InvalidRangeError(BlockNum head_block_num, uint64_t count);

    BlockNum head_block_num() const noexcept { return head_block_num_; }
    uint64_t count() const noexcept { return count_; }

  private:
    BlockNum head_block_num_;
    uint64_t count_;
};

}  // namespace zkgas::analysis
