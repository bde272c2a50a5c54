// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_fetcher.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/system/system_error.hpp>

#include <zkgas/analysis/errors.hpp>
#include <zkgas/infra/common/log.hpp>
#include <zkgas/infra/concurrency/timeout.hpp>
#include <zkgas/rpc/common/errors.hpp>
#include <zkgas/rpc/json/types.hpp>

namespace zkgas::analysis {

static uint64_t required_quantity(const nlohmann::json& block, std::string_view field) {
    const auto it = block.find(field);
    if (it == block.end() || it->is_null()) {
        throw RemoteFetchError{"malformed block: missing " + std::string{field}};
    }
    if (!it->is_string()) {
        throw RemoteFetchError{"malformed block: " + std::string{field} + " is not a quantity"};
    }
    try {
        return rpc::from_quantity(it->get<std::string>());
    } catch (const std::invalid_argument& ia) {
        throw RemoteFetchError{"malformed block: " + std::string{field} + " " + ia.what()};
    }
}

static uint64_t optional_quantity(const nlohmann::json& block, std::string_view field) {
    const auto it = block.find(field);
    if (it == block.end() || it->is_null()) {
        return 0;
    }
    return required_quantity(block, field);
}

BlockMetrics parse_block_metrics(const nlohmann::json& block) {
    if (!block.is_object()) {
        throw RemoteFetchError{"malformed block: not an object"};
    }
    const auto block_number = required_quantity(block, "number");
    const auto timestamp = required_quantity(block, "timestamp");
    const auto gas_limit = required_quantity(block, "gasLimit");
    const auto gas_used = required_quantity(block, "gasUsed");
    // Blocks before London have no base fee
    const auto base_fee = optional_quantity(block, "baseFeePerGas");
    return make_block_metrics(block_number, base_fee, gas_limit, gas_used, timestamp);
}

BlockMetrics BlockFetcher::fetch(const rpc::BlockNumOrTag& block_id) {
    nlohmann::json block;
    try {
        block = client_.get_block_by_number(block_id);
    } catch (const boost::system::system_error& se) {
        throw RemoteFetchError{"cannot fetch block " + block_id.to_string() + ": " + se.code().message()};
    } catch (const concurrency::TimeoutExpiredError& tee) {
        throw RemoteFetchError{"cannot fetch block " + block_id.to_string() + ": " + tee.what()};
    } catch (const rpc::RpcError& re) {
        throw RemoteFetchError{"cannot fetch block " + block_id.to_string() + ": " + re.what()};
    }
    if (block.is_null()) {
        throw RemoteFetchError{"block " + block_id.to_string() + " not found"};
    }

    auto metrics = parse_block_metrics(block);
    ZKGAS_DEBUG_M("Block fetched", {"number", std::to_string(metrics.block_number),
                                    "gas_used", std::to_string(metrics.gas_used),
                                    "gas_limit", std::to_string(metrics.gas_limit),
                                    "base_fee", std::to_string(metrics.base_fee_wei)});
    return metrics;
}

}  // namespace zkgas::analysis
