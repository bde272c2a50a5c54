// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

namespace zkgas {

StopWatch::TimePoint StopWatch::start() noexcept {
    started_ = true;
    start_time_ = Clock::now();
    stop_time_ = TimePoint{};
    return start_time_;
}

std::pair<StopWatch::TimePoint, StopWatch::Duration> StopWatch::stop() noexcept {
    if (!started_) {
        return {};
    }
    stop_time_ = Clock::now();
    started_ = false;
    return {stop_time_, std::chrono::duration_cast<Duration>(stop_time_ - start_time_)};
}

StopWatch::Duration StopWatch::elapsed() const noexcept {
    if (start_time_ == TimePoint{}) {
        return {};
    }
    const auto end_time{started_ ? Clock::now() : stop_time_};
    return std::chrono::duration_cast<Duration>(end_time - start_time_);
}

double StopWatch::elapsed_seconds() const noexcept {
    return std::chrono::duration<double>(elapsed()).count();
}

}  // namespace zkgas
