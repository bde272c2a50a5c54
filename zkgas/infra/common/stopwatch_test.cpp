// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <thread>

#include <catch2/catch_test_macros.hpp>

namespace zkgas {

using namespace std::chrono_literals;

TEST_CASE("StopWatch", "[zkgas][infra][stopwatch]") {
    SECTION("not started") {
        StopWatch sw;
        CHECK(!sw);
        CHECK(sw.elapsed() == StopWatch::Duration{});
        CHECK(sw.elapsed_seconds() == 0.0);
        const auto [stop_time, duration] = sw.stop();
        CHECK(stop_time == StopWatch::TimePoint{});
        CHECK(duration == StopWatch::Duration{});
    }

    SECTION("auto start") {
        StopWatch sw{StopWatch::kStart};
        CHECK(sw);
        std::this_thread::sleep_for(5ms);
        CHECK(sw.elapsed() >= 5ms);
    }

    SECTION("stop freezes elapsed time") {
        StopWatch sw;
        const auto start_time{sw.start()};
        std::this_thread::sleep_for(5ms);
        const auto [stop_time, duration] = sw.stop();
        CHECK(!sw);
        CHECK(stop_time > start_time);
        CHECK(duration >= 5ms);
        std::this_thread::sleep_for(5ms);
        CHECK(sw.elapsed() == duration);
    }

    SECTION("restart resets the clock") {
        StopWatch sw{StopWatch::kStart};
        std::this_thread::sleep_for(20ms);
        sw.start();
        CHECK(sw.elapsed() < 20ms);
    }
}

}  // namespace zkgas
