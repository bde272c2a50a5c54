// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include <zkgas/rpc/common/constants.hpp>
#include <zkgas/rpc/common/errors.hpp>

namespace zkgas::rpc {

static constexpr std::string_view kSchemeSeparator{"://"};

bool Endpoint::is_secure() const {
    return scheme == kHttpsScheme;
}

std::string Endpoint::host_header() const {
    const auto default_port{is_secure() ? kDefaultHttpsPort : kDefaultHttpPort};
    const std::string host_name{absl::StrContains(host, ':') ? absl::StrCat("[", host, "]") : host};
    return port == default_port ? host_name : absl::StrCat(host_name, ":", port);
}

bool has_http_scheme(std::string_view url) {
    return absl::StartsWith(url, "http://") || absl::StartsWith(url, "https://");
}

Endpoint Endpoint::parse(std::string_view url) {
    if (!has_http_scheme(url)) {
        throw ConfigurationError{"invalid RPC URL format: " + std::string{url}};
    }

    Endpoint endpoint;
    const auto scheme_end{url.find(kSchemeSeparator)};
    endpoint.scheme = absl::AsciiStrToLower(url.substr(0, scheme_end));
    std::string_view rest{url.substr(scheme_end + kSchemeSeparator.size())};

    // Split authority from path, query string belongs to the target as is
    const auto target_start{rest.find_first_of("/?")};
    std::string_view authority{rest.substr(0, target_start)};
    endpoint.target = target_start == std::string_view::npos ? "/" : std::string{rest.substr(target_start)};
    if (!endpoint.target.empty() && endpoint.target.front() == '?') {
        endpoint.target.insert(endpoint.target.begin(), '/');
    }

    // Credentials are not supported in the authority part
    if (authority.find('@') != std::string_view::npos) {
        throw ConfigurationError{"invalid RPC URL format: user info not supported in " + std::string{url}};
    }

    std::string_view host{authority};
    std::string_view port;
    if (absl::StartsWith(authority, "[")) {
        // IPv6 literal, e.g. [::1]:8545
        const auto bracket_end{authority.find(']')};
        if (bracket_end == std::string_view::npos) {
            throw ConfigurationError{"invalid RPC URL format: unterminated IPv6 address in " + std::string{url}};
        }
        host = authority.substr(1, bracket_end - 1);
        const std::string_view after{authority.substr(bracket_end + 1)};
        if (!after.empty()) {
            if (after.front() != ':') {
                throw ConfigurationError{"invalid RPC URL format: " + std::string{url}};
            }
            port = after.substr(1);
        }
    } else if (const auto colon{authority.rfind(':')}; colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) {
        throw ConfigurationError{"invalid RPC URL format: missing host in " + std::string{url}};
    }
    endpoint.host = std::string{host};

    if (port.empty()) {
        endpoint.port = std::string{endpoint.is_secure() ? kDefaultHttpsPort : kDefaultHttpPort};
    } else {
        uint32_t port_number{0};
        if (!absl::SimpleAtoi(port, &port_number) || port_number == 0 || port_number > 65535) {
            throw ConfigurationError{"invalid RPC URL format: bad port in " + std::string{url}};
        }
        endpoint.port = std::to_string(port_number);
    }

    return endpoint;
}

}  // namespace zkgas::rpc
