/*
   Copyright 2023 The Blockgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <blockgate/config.hpp>

#include <cxxabi.h>
#include <algorithm>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/flags/usage_config.h>
#include <absl/strings/match.h>
#include <absl/strings/string_view.h>
#include <boost/asio/signal_set.hpp>
#include <boost/process/environment.hpp>

#include <blockgate/common/constants.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/common/settings.hpp>
#include <blockgate/concurrency/context_pool.hpp>
#include <blockgate/http/server.hpp>
#include <blockgate/node/endpoint.hpp>
#include <blockgate/node/rpc_client.hpp>

ABSL_FLAG(std::string, config, blockgate::kDefaultConfigFile, "gateway configuration file path as string");
ABSL_FLAG(uint32_t, numContexts, std::max(std::thread::hardware_concurrency() / 2, 1u), "number of running I/O contexts as 32-bit integer");
ABSL_FLAG(blockgate::LogLevel, logLevel, blockgate::LogLevel::Info, "logging level");

const char* currentExceptionTypeName() {
    int status;
    return abi::__cxa_demangle(abi::__cxa_current_exception_type()->name(), 0, 0, &status);
}

int main(int argc, char* argv[]) {
    const auto pid = boost::this_process::get_id();
    const auto tid = std::this_thread::get_id();

    absl::FlagsUsageConfig config;
    config.contains_helpshort_flags = [](absl::string_view) { return false; };
    config.contains_help_flags = [](absl::string_view filename) { return absl::EndsWith(filename, "main.cpp"); };
    config.contains_helppackage_flags = [](absl::string_view) { return false; };
    config.normalize_filename = [](absl::string_view f) { return std::string{f.substr(f.rfind("/") + 1)}; };
    config.version_string = []() { return "blockgated 0.1.0\n"; };
    absl::SetFlagsUsageConfig(config);
    absl::SetProgramUsageMessage("REST gateway exposing blocks and transactions of a JSON-RPC blockchain node");
    absl::ParseCommandLine(argc, argv);

    BLOCKGATE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));
    BLOCKGATE_LOG_THREAD(true);

    std::set_terminate([](){
        BLOCKGATE_CRIT << "blockgate terminating with exception\n";
        try {
           auto exc = std::current_exception();
           if (exc)
               std::rethrow_exception(exc);
        } catch(const std::exception& e) {
           BLOCKGATE_CRIT << "Caught exception: " << e.what() << "\n";
        } catch(...) {
           BLOCKGATE_CRIT << "Type of caught exception is " << currentExceptionTypeName() << "\n";
        }

        std::abort();
    });

    try {
        const auto config_path{absl::GetFlag(FLAGS_config)};
        blockgate::GatewaySettings settings;
        try {
            settings = blockgate::load_settings(config_path);
        } catch (const std::exception& e) {
            BLOCKGATE_CRIT << "Configuration error: " << e.what() << "\n";
            BLOCKGATE_ERROR << "Use --config flag to specify the path of a valid configuration file\n";
            return -1;
        }

        auto numContexts{absl::GetFlag(FLAGS_numContexts)};
        if (numContexts == 0) {
            BLOCKGATE_ERROR << "Parameter numContexts is invalid: [" << numContexts << "]\n";
            BLOCKGATE_ERROR << "Use --numContexts flag to specify the number of threads running I/O contexts\n";
            return -1;
        }

        BLOCKGATE_LOG << "Blockgate launched with node " << settings.rpc.url << " using " << numContexts << " contexts\n";

        // The node location and credentials are shared read-only by every client in the pool
        const auto endpoint = std::make_shared<const blockgate::node::NodeEndpoint>(settings.rpc);
        blockgate::ClientFactory create_client = [endpoint](boost::asio::io_context& io_context) {
            return blockgate::node::make_rpc_client(io_context, endpoint);
        };

        blockgate::ContextPool context_pool{numContexts, create_client};

        const auto local_end_point{settings.server.host + blockgate::kAddressPortSeparator + std::to_string(settings.server.port)};
        blockgate::http::Server rest_service{settings.server.host, std::to_string(settings.server.port), context_pool};

        auto& io_context = context_pool.next_io_context();
        boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
        BLOCKGATE_DEBUG << "Signals registered on io_context " << &io_context << "\n" << std::flush;
        signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
            std::cout << "\n";
            BLOCKGATE_INFO << "Signal caught, error: " << error.message() << " number: " << signal_number << "\n" << std::flush;
            rest_service.stop();
            context_pool.stop();
        });

        BLOCKGATE_LOG << "Blockgate starting REST API service at " << local_end_point << "\n";
        rest_service.start();

        BLOCKGATE_LOG << "Blockgate is now running [pid=" << pid << ", main thread=" << tid << "]\n";

        context_pool.run();
    } catch (const std::exception& e) {
        BLOCKGATE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        return -1;
    }

    BLOCKGATE_LOG << "Blockgate exiting [pid=" << pid << ", main thread=" << tid << "]\n" << std::flush;

    return 0;
}
