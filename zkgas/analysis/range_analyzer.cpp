// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "range_analyzer.hpp"

#include <boost/system/system_error.hpp>

#include <zkgas/analysis/errors.hpp>
#include <zkgas/infra/common/ensure.hpp>
#include <zkgas/infra/common/log.hpp>
#include <zkgas/infra/concurrency/timeout.hpp>
#include <zkgas/rpc/common/errors.hpp>

namespace zkgas::analysis {

RangeAnalyzer::RangeAnalyzer(rpc::NodeClient& client, ProgressSink& progress_sink)
    : client_{client}, fetcher_{client}, progress_sink_{progress_sink} {}

BlockNumRange RangeAnalyzer::compute_range(BlockNum head_block_num, uint64_t count) {
    ensure_pre_condition(count > 0, [&]() { return "block count must be positive"; });
    if (count - 1 > head_block_num) {
        throw InvalidRangeError{head_block_num, count};
    }
    return BlockNumRange{head_block_num - (count - 1), head_block_num};
}

std::vector<BlockMetrics> RangeAnalyzer::analyze(uint64_t count) {
    ensure_pre_condition(count > 0, [&]() { return "block count must be positive"; });

    const auto range = compute_range(head_block_num(), count);
    ZKGAS_INFO_M("Analyzing blocks", {"range", range.to_string(), "count", std::to_string(count)});

    std::vector<BlockMetrics> blocks;
    blocks.reserve(count);
    for (uint64_t offset{0}; offset < count; ++offset) {
        const BlockNum block_num{range.start + offset};
        blocks.push_back(fetcher_.fetch(rpc::BlockNumOrTag{block_num}));
        progress_sink_.report(Progress{
            .block_num = block_num,
            .processed = blocks.size(),
            .total = count,
        });
    }
    return blocks;
}

BlockNum RangeAnalyzer::head_block_num() {
    try {
        const auto head = client_.block_number();
        ZKGAS_DEBUG << "RangeAnalyzer chain head: " << head;
        return head;
    } catch (const boost::system::system_error& se) {
        throw RemoteFetchError{"cannot fetch latest block number: " + se.code().message()};
    } catch (const concurrency::TimeoutExpiredError& tee) {
        throw RemoteFetchError{std::string{"cannot fetch latest block number: "} + tee.what()};
    } catch (const rpc::RpcError& re) {
        throw RemoteFetchError{std::string{"cannot fetch latest block number: "} + re.what()};
    }
}

}  // namespace zkgas::analysis
