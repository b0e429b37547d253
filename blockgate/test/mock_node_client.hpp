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

#ifndef BLOCKGATE_TEST_MOCK_NODE_CLIENT_HPP_
#define BLOCKGATE_TEST_MOCK_NODE_CLIENT_HPP_

#include <string>

#include <boost/asio/awaitable.hpp>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include <blockgate/node/client.hpp>
#include <blockgate/node/error.hpp>

namespace blockgate::test {

class MockNodeClient : public node::Client {
public:
    MOCK_METHOD((boost::asio::awaitable<nlohmann::json>), call, (const std::string& method, const nlohmann::json& params));
};

//! Coroutine completing with the given result, parameters are taken by value to live in the coroutine frame
inline boost::asio::awaitable<nlohmann::json> node_result(nlohmann::json result) {
    co_return result;
}

//! Coroutine failing with a NodeError of the given kind
inline boost::asio::awaitable<nlohmann::json> node_failure(node::NodeErrc errc, std::string message) {
    throw node::NodeError{errc, message};
    co_return nlohmann::json{};
}

}  // namespace blockgate::test

#endif  // BLOCKGATE_TEST_MOCK_NODE_CLIENT_HPP_
