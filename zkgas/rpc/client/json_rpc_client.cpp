// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_client.hpp"

#include <stdexcept>
#include <utility>

#include <boost/system/system_error.hpp>

#include <zkgas/infra/common/ensure.hpp>
#include <zkgas/infra/common/log.hpp>
#include <zkgas/infra/concurrency/timeout.hpp>
#include <zkgas/rpc/common/constants.hpp>
#include <zkgas/rpc/common/errors.hpp>
#include <zkgas/rpc/json/types.hpp>

namespace zkgas::rpc {

JsonRpcClient::JsonRpcClient(std::unique_ptr<Transport> transport) : transport_{std::move(transport)} {
    ensure(transport_ != nullptr, "JsonRpcClient: transport is null");
}

bool JsonRpcClient::is_connected() {
    try {
        const auto version = client_version();
        ZKGAS_DEBUG << "JsonRpcClient connected to node: " << version;
        return true;
    } catch (const boost::system::system_error& se) {
        ZKGAS_DEBUG << "JsonRpcClient::is_connected network failure: " << se.what();
    } catch (const concurrency::TimeoutExpiredError& tee) {
        ZKGAS_DEBUG << "JsonRpcClient::is_connected no answer in time: " << tee.what();
    } catch (const RpcError& re) {
        ZKGAS_DEBUG << "JsonRpcClient::is_connected protocol failure: " << re.what();
    }
    return false;
}

std::string JsonRpcClient::client_version() {
    const auto result = call(method::k_web3_clientVersion, nlohmann::json::array());
    if (!result.is_string()) {
        throw InvalidResponseError{"web3_clientVersion result is not a string"};
    }
    return result.get<std::string>();
}

BlockNum JsonRpcClient::block_number() {
    const auto result = call(method::k_eth_blockNumber, nlohmann::json::array());
    if (!result.is_string()) {
        throw InvalidResponseError{"eth_blockNumber result is not a quantity"};
    }
    try {
        return from_quantity(result.get<std::string>());
    } catch (const std::invalid_argument& ia) {
        throw InvalidResponseError{std::string{"eth_blockNumber result: "} + ia.what()};
    }
}

nlohmann::json JsonRpcClient::get_block_by_number(const BlockNumOrTag& block_id) {
    const bool full_transactions{false};
    auto result = call(method::k_eth_getBlockByNumber, nlohmann::json::array({block_id.to_string(), full_transactions}));
    if (!result.is_null() && !result.is_object()) {
        throw InvalidResponseError{"eth_getBlockByNumber result is not an object"};
    }
    return result;
}

nlohmann::json JsonRpcClient::call(std::string_view method, const nlohmann::json& params) {
    const uint64_t request_id{next_request_id_++};
    const auto request = make_json_request(request_id, method, params);
    ZKGAS_DEBUG << "JsonRpcClient::call method=" << method << " id=" << request_id;
    const auto response_body = transport_->post(request.dump());
    return extract_result(request_id, response_body);
}

nlohmann::json JsonRpcClient::extract_result(uint64_t request_id, const std::string& response_body) const {
    const auto response = nlohmann::json::parse(response_body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (response.is_discarded()) {
        throw InvalidResponseError{"body is not valid JSON"};
    }
    if (!response.is_object()) {
        throw InvalidResponseError{"body is not a JSON object"};
    }
    if (const auto id_it = response.find("id"); id_it == response.end() || !id_it->is_number_unsigned() ||
                                                id_it->get<uint64_t>() != request_id) {
        throw InvalidResponseError{"id does not match request " + std::to_string(request_id)};
    }
    if (const auto error_it = response.find("error"); error_it != response.end() && !error_it->is_null()) {
        Error error;
        if (error_it->is_object()) {
            if (const auto code_it = error_it->find("code"); code_it != error_it->end() && code_it->is_number_integer()) {
                error.code = code_it->get<int>();
            }
            if (const auto msg_it = error_it->find("message"); msg_it != error_it->end() && msg_it->is_string()) {
                error.message = msg_it->get<std::string>();
            }
        } else {
            error.message = error_it->dump();
        }
        throw JsonRpcError{std::move(error)};
    }
    const auto result_it = response.find("result");
    if (result_it == response.end()) {
        throw InvalidResponseError{"missing result"};
    }
    return *result_it;
}

}  // namespace zkgas::rpc
