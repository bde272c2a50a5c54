// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "http_transport.hpp"

#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <zkgas/infra/common/log.hpp>
#include <zkgas/infra/concurrency/awaitable_wait_for_one.hpp>
#include <zkgas/infra/concurrency/sync_wait.hpp>
#include <zkgas/infra/concurrency/timeout.hpp>
#include <zkgas/rpc/common/constants.hpp>
#include <zkgas/rpc/common/errors.hpp>

namespace zkgas::rpc {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

static constexpr int kHttpVersion{11};
static constexpr std::chrono::seconds kTlsShutdownTimeout{1};
// Stream expiry past the call deadline, for stream operations not honouring cancellation
static constexpr std::chrono::seconds kExpiryPastDeadline{1};

HttpTransport::HttpTransport(Endpoint endpoint, std::chrono::seconds timeout)
    : endpoint_{std::move(endpoint)}, timeout_{timeout}, ssl_context_{ssl::context::tls_client} {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);
}

std::string HttpTransport::post(const std::string& body) {
    ZKGAS_TRACE << "HttpTransport::post request: " << body;
    Response response = sync_wait(ioc_, exchange_with_timeout(make_request(body)));
    if (response.result() != http::status::ok) {
        throw HttpStatusError{response.result_int(), std::string{response.reason()}};
    }
    ZKGAS_TRACE << "HttpTransport::post response: " << response.body();
    return std::move(response.body());
}

HttpTransport::Request HttpTransport::make_request(const std::string& body) const {
    Request request{http::verb::post, endpoint_.target, kHttpVersion};
    request.set(http::field::host, endpoint_.host_header());
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");
    request.keep_alive(false);
    request.body() = body;
    request.prepare_payload();
    return request;
}

Task<HttpTransport::Response> HttpTransport::exchange_with_timeout(Request request) {
    using namespace concurrency::awaitable_wait_for_one;
    // Name resolution, connection, TLS handshake and HTTP round trip share one deadline
    auto result = co_await (exchange(std::move(request)) || concurrency::timeout(timeout_));
    co_return std::get<0>(std::move(result));
}

Task<HttpTransport::Response> HttpTransport::exchange(Request request) {
    auto executor = co_await boost::asio::this_coro::executor;

    tcp::resolver resolver{executor};
    const auto endpoints = co_await resolver.async_resolve(endpoint_.host, endpoint_.port, use_awaitable);
    ZKGAS_DEBUG << "HttpTransport resolved " << endpoint_.host << ":" << endpoint_.port;

    if (!endpoint_.is_secure()) {
        beast::tcp_stream stream{executor};
        stream.expires_after(timeout_ + kExpiryPastDeadline);
        co_await stream.async_connect(endpoints, use_awaitable);
        auto response = co_await write_and_read(stream, request);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != boost::asio::error::not_connected) {
            ZKGAS_DEBUG << "HttpTransport shutdown failed: " << ec.message();
        }
        co_return response;
    }

    beast::ssl_stream<beast::tcp_stream> stream{executor, ssl_context_};
    // Set SNI hostname, many hosts need this to handshake successfully
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        const boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
        throw boost::system::system_error{ec, "HttpTransport cannot set SNI hostname"};
    }

    beast::get_lowest_layer(stream).expires_after(timeout_ + kExpiryPastDeadline);
    co_await beast::get_lowest_layer(stream).async_connect(endpoints, use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, use_awaitable);

    auto response = co_await write_and_read(stream, request);

    boost::system::error_code ec;
    beast::get_lowest_layer(stream).expires_after(kTlsShutdownTimeout);
    co_await stream.async_shutdown(boost::asio::redirect_error(use_awaitable, ec));
    // Peers frequently close the connection without TLS close_notify
    if (ec && ec != boost::asio::error::eof && ec != ssl::error::stream_truncated && ec != beast::error::timeout) {
        ZKGAS_DEBUG << "HttpTransport TLS shutdown failed: " << ec.message();
    }
    co_return response;
}

template <typename Stream>
Task<HttpTransport::Response> HttpTransport::write_and_read(Stream& stream, Request& request) {
    co_await http::async_write(stream, request, use_awaitable);

    beast::flat_buffer buffer;
    Response response;
    co_await http::async_read(stream, buffer, response, use_awaitable);
    co_return response;
}

}  // namespace zkgas::rpc
