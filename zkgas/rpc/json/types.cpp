// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <algorithm>
#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include <zkgas/rpc/common/constants.hpp>

namespace zkgas::rpc {

// Up to 16 hex digits fit into 64 bits
static constexpr size_t kMaxQuantityDigits{16};

uint64_t from_quantity(std::string_view hex_quantity) {
    if (!absl::StartsWithIgnoreCase(hex_quantity, "0x")) {
        throw std::invalid_argument{"quantity without 0x prefix: " + std::string{hex_quantity}};
    }
    std::string_view digits{hex_quantity.substr(2)};
    if (digits.empty() || digits.size() > kMaxQuantityDigits) {
        throw std::invalid_argument{"quantity out of range: " + std::string{hex_quantity}};
    }
    uint64_t number{0};
    if (!std::all_of(digits.cbegin(), digits.cend(), absl::ascii_isxdigit) || !absl::SimpleHexAtoi(digits, &number)) {
        throw std::invalid_argument{"quantity is not hex: " + std::string{hex_quantity}};
    }
    return number;
}

std::string to_quantity(uint64_t number) {
    static constexpr const char* kHexDigits{"0123456789abcdef"};

    if (number == 0) {
        return "0x0";
    }
    std::string out;
    while (number != 0) {
        out.insert(out.begin(), kHexDigits[number & 0x0f]);
        number >>= 4;
    }
    return "0x" + out;
}

nlohmann::json make_json_request(uint64_t id, std::string_view method, const nlohmann::json& params) {
    nlohmann::json request;
    request["jsonrpc"] = kJsonRpcVersion;
    request["id"] = id;
    request["method"] = method;
    request["params"] = params.is_null() ? nlohmann::json::array() : params;
    return request;
}

}  // namespace zkgas::rpc
