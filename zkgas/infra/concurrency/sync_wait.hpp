// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <zkgas/infra/concurrency/task.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace zkgas {

/**
 * Run a coroutine to completion on the specified io_context using the calling thread
 *
 * sync_wait:
 * - schedules a coroutine for execution in the specified io_context
 * - drives the io_context on the calling thread until no more work is pending
 * - returns the result of the coroutine or rethrows its exception
 *
 * The io_context must not be run by any other thread: this is meant for single-shot
 * blocking calls where exactly one asynchronous operation is in flight at any time.
 */
template <typename T>
T sync_wait(boost::asio::io_context& io_context, Task<T>&& task) {
    auto future_result = boost::asio::co_spawn(io_context, std::move(task), boost::asio::use_future);
    io_context.restart();
    io_context.run();
    return future_result.get();
}

}  // namespace zkgas
