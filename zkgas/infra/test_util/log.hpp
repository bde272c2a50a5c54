// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <sstream>
#include <string>

#include <zkgas/infra/common/log.hpp>

namespace zkgas::test_util {

//! Change the log verbosity for the current scope, restoring the previous one on exit
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : previous_level_{log::get_verbosity()} {
        log::set_verbosity(level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(previous_level_); }

    SetLogVerbosityGuard(const SetLogVerbosityGuard&) = delete;
    SetLogVerbosityGuard& operator=(const SetLogVerbosityGuard&) = delete;

  private:
    log::Level previous_level_;
};

//! Redirect everything written to \p stream into an in-memory buffer for the current scope
class StreamCapture {
  public:
    explicit StreamCapture(std::ostream& stream) : stream_{stream}, original_buffer_{stream.rdbuf(captured_.rdbuf())} {}
    ~StreamCapture() { stream_.rdbuf(original_buffer_); }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string str() const { return captured_.str(); }

  private:
    std::ostringstream captured_;
    std::ostream& stream_;
    std::streambuf* original_buffer_;
};

}  // namespace zkgas::test_util
