// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace zkgas::rpc {

//! Decode a JSON-RPC hex quantity (e.g. "0x1b4") into a 64-bit unsigned integer
//! \throws std::invalid_argument if the quantity is not 0x-prefixed hex or exceeds 64 bits
uint64_t from_quantity(std::string_view hex_quantity);

//! Encode a 64-bit unsigned integer as JSON-RPC hex quantity without leading zeros
std::string to_quantity(uint64_t number);

//! Build the JSON-RPC 2.0 request envelope for the given method call
nlohmann::json make_json_request(uint64_t id, std::string_view method, const nlohmann::json& params);

}  // namespace zkgas::rpc
