// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <zkgas/analysis/block_metrics.hpp>
#include <zkgas/rpc/client/node_client.hpp>
#include <zkgas/rpc/types/block_id.hpp>

namespace zkgas::analysis {

//! Retrieves one block header from the node and extracts its gas metrics
class BlockFetcher {
  public:
    explicit BlockFetcher(rpc::NodeClient& client) : client_{client} {}

    //! Issue exactly one eth_getBlockByNumber call for the given block
    //! \throws RemoteFetchError if the call fails, the block is unknown or the header is malformed
    BlockMetrics fetch(const rpc::BlockNumOrTag& block_id);

  private:
    rpc::NodeClient& client_;
};

//! Extract the gas metrics from a block object returned by eth_getBlockByNumber
//! \throws RemoteFetchError if any of number, timestamp, gasLimit, gasUsed is missing or not a quantity
BlockMetrics parse_block_metrics(const nlohmann::json& block);

}  // namespace zkgas::analysis
