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

#ifndef BLOCKGATE_NODE_CLIENT_HPP_
#define BLOCKGATE_NODE_CLIENT_HPP_

#include <string>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

namespace blockgate::node {

//! Client side of the node JSON-RPC interface.
class Client {
  public:
    virtual ~Client() = default;

    //! Invoke \p method with the given positional \p params and return the JSON-RPC result.
    //! Any failure is raised as NodeError, no call is ever retried.
    virtual boost::asio::awaitable<nlohmann::json> call(const std::string& method, const nlohmann::json& params) = 0;
};

} // namespace blockgate::node

#endif  // BLOCKGATE_NODE_CLIENT_HPP_
