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

#include "tx_api.hpp"

#include <memory>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include <blockgate/common/log.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/test/mock_node_client.hpp>

namespace blockgate::commands {

using testing::_;
using testing::InvokeWithoutArgs;

class TxRestApiTest : public TxRestApi {
public:
    explicit TxRestApiTest(std::unique_ptr<node::Client>& client) : TxRestApi(client) {}

    using TxRestApi::handle_get_transaction;
};

static const std::string kTxId{"4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b"};

static const nlohmann::json kTransaction = R"({
    "txid":"4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b",
    "hash":"4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b",
    "version":1,
    "size":204,
    "locktime":0,
    "vin":[{"coinbase":"04ffff001d0104","sequence":4294967295}],
    "vout":[{"value":50.0,"n":0}]
})"_json;

namespace {
http::Reply run_get_transaction(TxRestApiTest& api, const std::string& txid) {
    http::Reply reply;
    boost::asio::io_context io_context;
    auto result{boost::asio::co_spawn(io_context, api.handle_get_transaction(txid, reply), boost::asio::use_future)};
    io_context.run();
    result.get();
    return reply;
}
} // namespace

TEST_CASE("handle_get_transaction succeeds if node returns the transaction", "[blockgate][commands][tx_api]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto* mock = new test::MockNodeClient;
    std::unique_ptr<node::Client> client{mock};
    EXPECT_CALL(*mock, call("getrawtransaction", nlohmann::json::array({kTxId, true}))).WillOnce(InvokeWithoutArgs([]() {
        return test::node_result(kTransaction);
    }));
    TxRestApiTest api{client};

    const auto reply = run_get_transaction(api, kTxId);
    CHECK(reply.status == http::Reply::ok);
    CHECK(nlohmann::json::parse(reply.content) == kTransaction);
    CHECK(reply.header("Content-Type") == "application/json");
}

TEST_CASE("handle_get_transaction fails with 400 on invalid txid", "[blockgate][commands][tx_api]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto* mock = new test::MockNodeClient;
    std::unique_ptr<node::Client> client{mock};
    EXPECT_CALL(*mock, call(_, _)).Times(0);
    TxRestApiTest api{client};

    const auto reply = run_get_transaction(api, "not-a-transaction-id");
    CHECK(reply.status == http::Reply::bad_request);
    CHECK(reply.content == "Invalid transaction id");
}

TEST_CASE("handle_get_transaction fails with 500 on node error", "[blockgate][commands][tx_api]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto* mock = new test::MockNodeClient;
    std::unique_ptr<node::Client> client{mock};
    EXPECT_CALL(*mock, call("getrawtransaction", _)).WillOnce(InvokeWithoutArgs([]() {
        return test::node_failure(node::NodeErrc::rpc_failure, "No such mempool or blockchain transaction");
    }));
    TxRestApiTest api{client};

    const auto reply = run_get_transaction(api, kTxId);
    CHECK(reply.status == http::Reply::internal_server_error);
    CHECK(reply.content == "Failed to retrieve transaction information");
}

} // namespace blockgate::commands
