// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "timeout.hpp"

#include <stdexcept>
#include <variant>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <catch2/catch_test_macros.hpp>

#include <zkgas/infra/concurrency/awaitable_wait_for_one.hpp>
#include <zkgas/infra/concurrency/sync_wait.hpp>

namespace zkgas::concurrency {

using namespace std::chrono_literals;
using namespace boost::asio;

class TestException : public std::runtime_error {
  public:
    TestException() : std::runtime_error("TestException") {}
};

template <typename T>
Task<T> async_value(T value) {
    co_await this_coro::executor;
    co_return value;
}

Task<int> async_throw() {
    co_await this_coro::executor;
    throw TestException();
}

Task<int> wait_until_cancelled() {
    auto executor = co_await this_coro::executor;
    steady_timer timer(executor);
    timer.expires_after(1h);
    co_await timer.async_wait(use_awaitable);
    co_return 0;
}

template <typename TResult>
TResult run(Task<TResult> task) {
    io_context ioc;
    return sync_wait(ioc, std::move(task));
}

TEST_CASE("Timeout.timeout", "[zkgas][infra][concurrency]") {
    CHECK_THROWS_AS(run(timeout(1ms)), TimeoutExpiredError);
}

TEST_CASE("Timeout.wait_for_one.value_or_timeout", "[zkgas][infra][concurrency]") {
    using namespace awaitable_wait_for_one;
    const auto result = run(async_value(123) || timeout(1h));
    REQUIRE(result.index() == 0);
    CHECK(std::get<0>(result) == 123);
}

TEST_CASE("Timeout.wait_for_one.throw_or_timeout", "[zkgas][infra][concurrency]") {
    using namespace awaitable_wait_for_one;
    CHECK_THROWS_AS(run(async_throw() || timeout(1h)), TestException);
}

TEST_CASE("Timeout.wait_for_one.cancel_or_timeout", "[zkgas][infra][concurrency]") {
    using namespace awaitable_wait_for_one;
    CHECK_THROWS_AS(run(wait_until_cancelled() || timeout(1ms)), TimeoutExpiredError);
}

}  // namespace zkgas::concurrency
