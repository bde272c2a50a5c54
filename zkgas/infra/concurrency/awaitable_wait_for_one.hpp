// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace zkgas::concurrency::awaitable_wait_for_one {

//! Wait for the first of two operations to complete, the other one gets cancelled
/**
 * The first operation to complete decides the outcome even when it fails: its exception
 * is rethrown as-is. Typical usage is bounding a task with a deadline:
 *   co_await (task() || concurrency::timeout(duration));
 */
template <typename T, typename Executor>
    requires(!std::is_void_v<T>)
boost::asio::awaitable<std::variant<T, std::monostate>, Executor> operator||(boost::asio::awaitable<T, Executor> t,
                                                                             boost::asio::awaitable<void, Executor> u) {
    using boost::asio::experimental::make_parallel_group;
    using boost::asio::experimental::wait_for_one;

    auto ex = co_await boost::asio::this_coro::executor;

    auto [order, ex0, value, ex1] =
        co_await make_parallel_group(boost::asio::co_spawn(ex, std::move(t), boost::asio::deferred),
                                     boost::asio::co_spawn(ex, std::move(u), boost::asio::deferred))
            .async_wait(wait_for_one(), boost::asio::use_awaitable_t<Executor>{});

    if (order[0] == 0) {
        if (ex0) std::rethrow_exception(ex0);
        co_return std::variant<T, std::monostate>{std::in_place_index<0>, std::move(value)};
    }
    if (ex1) std::rethrow_exception(ex1);
    co_return std::variant<T, std::monostate>{std::in_place_index<1>};
}

}  // namespace zkgas::concurrency::awaitable_wait_for_one
