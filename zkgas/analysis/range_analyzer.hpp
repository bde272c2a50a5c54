// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <zkgas/analysis/block_fetcher.hpp>
#include <zkgas/analysis/block_metrics.hpp>
#include <zkgas/analysis/progress.hpp>
#include <zkgas/core/common/base.hpp>
#include <zkgas/rpc/client/node_client.hpp>

namespace zkgas::analysis {

//! Fetches the most recent blocks ending at the chain head, oldest first
class RangeAnalyzer {
  public:
    RangeAnalyzer(rpc::NodeClient& client, ProgressSink& progress_sink);

    //! Analyze the \p count most recent blocks, one fetch at a time in ascending block order
    //! \throws RemoteFetchError on any failure, no partial result is returned
    //! \throws InvalidRangeError if \p count exceeds the number of blocks in the chain
    std::vector<BlockMetrics> analyze(uint64_t count);

    //! The inclusive range of the \p count blocks ending at \p head_block_num
    //! \throws InvalidRangeError if the range would start before genesis
    static BlockNumRange compute_range(BlockNum head_block_num, uint64_t count);

  private:
    BlockNum head_block_num();

    rpc::NodeClient& client_;
    BlockFetcher fetcher_;
    ProgressSink& progress_sink_;
};

}  // namespace zkgas::analysis
