// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <zkgas/rpc/client/node_client.hpp>
#include <zkgas/rpc/client/transport.hpp>

namespace zkgas::rpc {

//! NodeClient speaking JSON-RPC 2.0 over the given transport, one request at a time
class JsonRpcClient : public NodeClient {
  public:
    explicit JsonRpcClient(std::unique_ptr<Transport> transport);

    bool is_connected() override;
    std::string client_version() override;
    BlockNum block_number() override;
    nlohmann::json get_block_by_number(const BlockNumOrTag& block_id) override;

    //! Send one request and return its result member
    //! \throws JsonRpcError if the node returns an error object
    //! \throws InvalidResponseError if the response is not a matching JSON-RPC 2.0 response
    nlohmann::json call(std::string_view method, const nlohmann::json& params);

  private:
    nlohmann::json extract_result(uint64_t request_id, const std::string& response_body) const;

    std::unique_ptr<Transport> transport_;
    uint64_t next_request_id_{1};
};

}  // namespace zkgas::rpc
