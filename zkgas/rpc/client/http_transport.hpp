// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <zkgas/infra/concurrency/task.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <zkgas/rpc/client/endpoint.hpp>
#include <zkgas/rpc/client/transport.hpp>

namespace zkgas::rpc {

//! HTTP(S) transport opening one connection per call, each call bounded by a fixed timeout
//! \throws concurrency::TimeoutExpiredError when the whole call takes longer than the timeout
class HttpTransport : public Transport {
  public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    HttpTransport(Endpoint endpoint, std::chrono::seconds timeout);

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    std::string post(const std::string& body) override;

    const Endpoint& endpoint() const { return endpoint_; }
    std::chrono::seconds timeout() const { return timeout_; }

    //! Build the HTTP POST request carrying the given JSON body
    Request make_request(const std::string& body) const;

  private:
    Task<Response> exchange_with_timeout(Request request);
    Task<Response> exchange(Request request);

    template <typename Stream>
    Task<Response> write_and_read(Stream& stream, Request& request);

    Endpoint endpoint_;
    std::chrono::seconds timeout_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_context_;
};

}  // namespace zkgas::rpc
