// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <utility>

namespace zkgas {

//! \brief Measures the wall-clock time spent by an operation
class StopWatch {
  public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    static constexpr bool kStart = true;

    explicit StopWatch(bool auto_start = false) {
        if (auto_start) start();
    }

    //! \brief Starts the clock, restarting from scratch if already started
    TimePoint start() noexcept;

    //! \brief Stops the watch
    //! \return The timepoint of stop and the duration since start
    std::pair<TimePoint, Duration> stop() noexcept;

    //! \brief Computes the duration amongst now and the start time (or the stop time if stopped)
    Duration elapsed() const noexcept;

    //! \brief Elapsed time in fractional seconds
    double elapsed_seconds() const noexcept;

    explicit operator bool() const noexcept { return started_; }

  private:
    bool started_{false};
    TimePoint start_time_{};
    TimePoint stop_time_{};
};

}  // namespace zkgas
