// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <stdexcept>

#include <zkgas/infra/concurrency/task.hpp>

namespace zkgas::concurrency {

//! Complete with TimeoutExpiredError once the duration has elapsed, or normally if cancelled before
Task<void> timeout(std::chrono::milliseconds duration);

class TimeoutExpiredError : public std::runtime_error {
  public:
    TimeoutExpiredError() : std::runtime_error("Timeout has expired") {}
};

}  // namespace zkgas::concurrency
