// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "runner.hpp"

#include <utility>
#include <vector>

#include <boost/system/system_error.hpp>

#include <zkgas/analysis/block_metrics.hpp>
#include <zkgas/analysis/errors.hpp>
#include <zkgas/analysis/range_analyzer.hpp>
#include <zkgas/analysis/report.hpp>
#include <zkgas/analysis/summarizer.hpp>
#include <zkgas/infra/common/clock_time.hpp>
#include <zkgas/infra/common/ensure.hpp>
#include <zkgas/infra/common/log.hpp>
#include <zkgas/infra/common/stopwatch.hpp>
#include <zkgas/rpc/client/http_transport.hpp>
#include <zkgas/rpc/client/json_rpc_client.hpp>
#include <zkgas/rpc/common/errors.hpp>

namespace zkgas::analysis {

static constexpr int kJsonIndent{2};

std::unique_ptr<rpc::NodeClient> make_http_node_client(const rpc::Endpoint& endpoint, std::chrono::seconds timeout) {
    return std::make_unique<rpc::JsonRpcClient>(std::make_unique<rpc::HttpTransport>(endpoint, timeout));
}

Runner::Runner(Settings settings, NodeClientFactory client_factory, std::ostream& out)
    : settings_{std::move(settings)}, client_factory_{std::move(client_factory)}, out_{out} {
    ensure(static_cast<bool>(client_factory_), "Runner: client factory is empty");
}

ExitCode Runner::run() {
    std::unique_ptr<rpc::NodeClient> client;
    try {
        client = connect();
    } catch (const rpc::ConfigurationError& ce) {
        ZKGAS_ERROR << "Runner: " << ce.what();
        out_ << "Invalid RPC URL format.\n";
        return ExitCode::kSetupFailure;
    } catch (const ConnectivityError& ce) {
        ZKGAS_ERROR << "Runner: " << ce.what();
        out_ << "RPC connection failed. Check RPC_URL.\n";
        return ExitCode::kSetupFailure;
    }

    try {
        analyze(*client);
    } catch (const RemoteFetchError& rfe) {
        ZKGAS_ERROR << "Runner: analysis failed: " << rfe.what();
        print_error(out_, rfe.what());
        return ExitCode::kAnalysisFailure;
    } catch (const InvalidRangeError& ire) {
        ZKGAS_ERROR << "Runner: analysis failed: " << ire.what();
        print_error(out_, ire.what());
        return ExitCode::kAnalysisFailure;
    }
    return ExitCode::kSuccess;
}

std::unique_ptr<rpc::NodeClient> Runner::connect() {
    const auto endpoint = rpc::Endpoint::parse(settings_.rpc_url);
    ZKGAS_DEBUG_M("Connecting", {"host", endpoint.host, "port", endpoint.port, "target", endpoint.target});

    std::unique_ptr<rpc::NodeClient> client;
    try {
        client = client_factory_(endpoint, settings_.timeout);
    } catch (const boost::system::system_error& se) {
        // e.g. TLS context cannot load the system trust store
        throw ConnectivityError{"cannot create client for " + settings_.rpc_url + ": " + se.what()};
    }
    if (!client->is_connected()) {
        throw ConnectivityError{"node at " + settings_.rpc_url + " is not reachable"};
    }
    return client;
}

void Runner::analyze(rpc::NodeClient& client) {
    print_header(out_, settings_.rpc_url, settings_.block_count, clock_time::now_iso8601_utc());

    StopWatch stop_watch{StopWatch::kStart};
    ConsoleProgressSink progress_sink{out_};
    RangeAnalyzer analyzer{client, progress_sink};
    const std::vector<BlockMetrics> blocks = analyzer.analyze(settings_.block_count);
    const auto summary = summarize(blocks);
    stop_watch.stop();
    const double elapsed_seconds{round_to(stop_watch.elapsed_seconds(), 2)};

    print_summary(out_, summary, elapsed_seconds);
    ZKGAS_INFO_M("Analysis completed", {"blocks", std::to_string(blocks.size()),
                                        "elapsed", std::to_string(elapsed_seconds) + "s"});

    if (settings_.json_output) {
        const auto report = make_json_report(settings_.rpc_url, clock_time::now_iso8601_utc(),
                                             blocks, summary, elapsed_seconds);
        out_ << report.dump(kJsonIndent, ' ', /*ensure_ascii=*/false) << '\n';
    }
}

}  // namespace zkgas::analysis
