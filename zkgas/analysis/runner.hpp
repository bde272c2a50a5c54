// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <ostream>

#include <zkgas/analysis/settings.hpp>
#include <zkgas/rpc/client/endpoint.hpp>
#include <zkgas/rpc/client/node_client.hpp>

namespace zkgas::analysis {

//! Process exit status of one analysis run
enum class ExitCode : int {
    kSuccess = 0,
    kSetupFailure = 1,     // malformed RPC URL or failed connectivity check
    kAnalysisFailure = 2,  // any failure while fetching or analyzing blocks
};

using NodeClientFactory = std::function<std::unique_ptr<rpc::NodeClient>(const rpc::Endpoint&, std::chrono::seconds)>;

//! Build the JSON-RPC client over HTTP(S) used by the command-line tool
std::unique_ptr<rpc::NodeClient> make_http_node_client(const rpc::Endpoint& endpoint, std::chrono::seconds timeout);

//! Drives one complete run: URL check, liveness check, range analysis, summary and report
class Runner {
  public:
    Runner(Settings settings, NodeClientFactory client_factory, std::ostream& out);

    //! Execute the run reporting any fatal error once to the output
    ExitCode run();

  private:
    std::unique_ptr<rpc::NodeClient> connect();
    void analyze(rpc::NodeClient& client);

    Settings settings_;
    NodeClientFactory client_factory_;
    std::ostream& out_;
};

}  // namespace zkgas::analysis
