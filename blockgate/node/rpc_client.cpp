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

#include "rpc_client.hpp"

#include <optional>
#include <utility>

#include <boost/system/system_error.hpp>

#include <blockgate/common/clock_time.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/node/envelope.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/node/http_transport.hpp>

namespace blockgate::node {

constexpr const char* kUnreadableBody{"<unreadable response body>"};

RpcClient::RpcClient(std::unique_ptr<Transport> transport) : transport_(std::move(transport)) {
    BLOCKGATE_TRACE << "RpcClient::ctor " << this << "\n";
}

RpcClient::~RpcClient() {
    BLOCKGATE_TRACE << "RpcClient::dtor " << this << "\n";
}

std::string RpcClient::next_request_id() {
    return std::to_string(++request_count_);
}

boost::asio::awaitable<nlohmann::json> RpcClient::call(const std::string& method, const nlohmann::json& params) {
    const auto start_time = clock_time::now();
    const auto request_id = next_request_id();
    BLOCKGATE_INFO << "RPC call method: " << method << " params: " << params.dump() << " id: " << request_id << "\n";

    const auto request = make_json_request(request_id, method, params);

    std::optional<TransportReply> reply;
    try {
        reply = co_await transport_->post(request.dump());
    } catch (const boost::system::system_error& se) {
        BLOCKGATE_ERROR << "RPC call method: " << method << " id: " << request_id << " connection failed: " << se.what() << "\n";
        throw NodeError{NodeErrc::connection_failed, "cannot reach node", se.what()};
    }

    BLOCKGATE_DEBUG << "RPC call method: " << method << " id: " << request_id << " response: " << reply->body << "\n";

    if (reply->status < 200 || reply->status > 299) {
        const auto body = reply->body.empty() ? std::string{kUnreadableBody} : reply->body;
        BLOCKGATE_ERROR << "RPC call method: " << method << " id: " << request_id
                        << " HTTP status: " << reply->status << " body: " << body << "\n";
        throw NodeError{NodeErrc::http_status, "HTTP status " + std::to_string(reply->status), body, reply->status};
    }

    Outcome outcome;
    try {
        outcome = parse_outcome(reply->body);
    } catch (const NodeError& e) {
        BLOCKGATE_ERROR << "RPC call method: " << method << " id: " << request_id
                        << " malformed response: " << e.what() << " body: " << e.detail() << "\n";
        throw;
    }

    if (outcome.id && *outcome.id != nlohmann::json(request_id)) {
        BLOCKGATE_ERROR << "RPC call method: " << method << " id: " << request_id
                        << " unexpected response id: " << outcome.id->dump() << "\n";
        throw NodeError{NodeErrc::malformed_response, "response id does not match request id", reply->body};
    }

    if (outcome.result) {
        BLOCKGATE_INFO << "RPC call method: " << method << " id: " << request_id << " succeeded"
                       << " t=" << clock_time::since(start_time) << "ns\n";
        co_return *outcome.result;
    }

    const auto error_message = make_error_message(outcome);
    BLOCKGATE_ERROR << "RPC call method: " << method << " id: " << request_id << " error: " << error_message << "\n";
    throw NodeError{NodeErrc::rpc_failure, error_message, reply->body};
}

std::unique_ptr<Client> make_rpc_client(boost::asio::io_context& io_context, std::shared_ptr<const NodeEndpoint> endpoint) {
    return std::make_unique<RpcClient>(std::make_unique<HttpTransport>(io_context, std::move(endpoint)));
}

} // namespace blockgate::node
