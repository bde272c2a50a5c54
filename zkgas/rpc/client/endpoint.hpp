// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

namespace zkgas::rpc {

//! Location of a JSON-RPC HTTP(S) endpoint split into the parts needed to connect
struct Endpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool is_secure() const;

    //! Value for the HTTP Host header, i.e. host plus port when it is not the scheme default
    std::string host_header() const;

    //! Parse an http:// or https:// URL, checking only its shape and never touching the network
    //! \throws ConfigurationError if the URL is malformed or uses another scheme
    static Endpoint parse(std::string_view url);
};

//! Whether the URL has the http:// or https:// scheme prefix
bool has_http_scheme(std::string_view url);

}  // namespace zkgas::rpc
