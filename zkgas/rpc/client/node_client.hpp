// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <zkgas/core/common/base.hpp>
#include <zkgas/rpc/types/block_id.hpp>

namespace zkgas::rpc {

//! The subset of the Ethereum JSON-RPC API needed to inspect recent blocks
class NodeClient {
  public:
    virtual ~NodeClient() = default;

    //! Liveness check: true if the node answers a trivial request, never throws
    virtual bool is_connected() = 0;

    //! web3_clientVersion
    virtual std::string client_version() = 0;

    //! eth_blockNumber
    virtual BlockNum block_number() = 0;

    //! eth_getBlockByNumber without full transactions
    //! \return the block object as returned by the node, null if the block is unknown
    virtual nlohmann::json get_block_by_number(const BlockNumOrTag& block_id) = 0;
};

}  // namespace zkgas::rpc
