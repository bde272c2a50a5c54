// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "timeout.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <zkgas/infra/common/log.hpp>

namespace zkgas::concurrency {

Task<void> timeout(std::chrono::milliseconds duration) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer{executor};
    timer.expires_after(duration);

    try {
        co_await timer.async_wait(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        // cancelled because the guarded operation completed first
        if (se.code() == boost::system::errc::operation_canceled) {
            co_return;
        }
        throw;
    }

    ZKGAS_TRACE << "Timeout expired after " << duration.count() << "ms";
    throw TimeoutExpiredError{};
}

}  // namespace zkgas::concurrency
