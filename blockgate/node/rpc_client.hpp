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

#ifndef BLOCKGATE_NODE_RPC_CLIENT_HPP_
#define BLOCKGATE_NODE_RPC_CLIENT_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <blockgate/node/client.hpp>
#include <blockgate/node/endpoint.hpp>
#include <blockgate/node/transport.hpp>

namespace blockgate::node {

//! JSON-RPC 2.0 client: envelope construction and normalization of every failure into NodeError.
class RpcClient : public Client {
  public:
    explicit RpcClient(std::unique_ptr<Transport> transport);
    ~RpcClient() override;

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    boost::asio::awaitable<nlohmann::json> call(const std::string& method, const nlohmann::json& params) override;

  private:
    std::string next_request_id();

    std::unique_ptr<Transport> transport_;

    //! Source of the per-call request identifiers
    std::atomic<uint64_t> request_count_{0};
};

//! Build the client talking HTTP to \p endpoint on the given scheduler.
std::unique_ptr<Client> make_rpc_client(boost::asio::io_context& io_context, std::shared_ptr<const NodeEndpoint> endpoint);

} // namespace blockgate::node

#endif  // BLOCKGATE_NODE_RPC_CLIENT_HPP_
