// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include <zkgas/rpc/client/node_client.hpp>
#include <zkgas/rpc/json/types.hpp>

namespace zkgas::rpc::test_util {

class MockNodeClient : public NodeClient {
  public:
    MOCK_METHOD((bool), is_connected, (), (override));
    MOCK_METHOD((std::string), client_version, (), (override));
    MOCK_METHOD((BlockNum), block_number, (), (override));
    MOCK_METHOD((nlohmann::json), get_block_by_number, (const BlockNumOrTag&), (override));
};

//! Block object shaped like an eth_getBlockByNumber result with the given gas figures
inline nlohmann::json make_block_json(BlockNum number, uint64_t gas_limit, uint64_t gas_used,
                                      uint64_t timestamp, std::optional<uint64_t> base_fee = std::nullopt) {
    nlohmann::json block{
        {"number", to_quantity(number)},
        {"hash", "0x9b83c12c69edb74f6c8dd5d052765c1adf940e320bd1291696e6fa07829eee71"},
        {"gasLimit", to_quantity(gas_limit)},
        {"gasUsed", to_quantity(gas_used)},
        {"timestamp", to_quantity(timestamp)},
        {"transactions", nlohmann::json::array()},
    };
    if (base_fee) {
        block["baseFeePerGas"] = to_quantity(*base_fee);
    }
    return block;
}

}  // namespace zkgas::rpc::test_util
