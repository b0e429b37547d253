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

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <blockgate/common/log.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/test/mock_transport.hpp>

namespace blockgate::node {

using testing::_;
using testing::Invoke;

namespace {
boost::asio::awaitable<TransportReply> echo_reply(std::string request_body, unsigned int status, nlohmann::json response) {
    const auto request = nlohmann::json::parse(request_body);
    response["id"] = request["id"];
    co_return TransportReply{status, response.dump()};
}

boost::asio::awaitable<TransportReply> raw_reply(unsigned int status, std::string body) {
    co_return TransportReply{status, std::move(body)};
}

boost::asio::awaitable<TransportReply> refused_reply() {
    throw boost::system::system_error{boost::asio::error::connection_refused};
    co_return TransportReply{};
}

nlohmann::json call_node(RpcClient& client, const std::string& method, const nlohmann::json& params) {
    boost::asio::io_context io_context;
    auto result{boost::asio::co_spawn(io_context, client.call(method, params), boost::asio::use_future)};
    io_context.run();
    return result.get();
}

NodeErrc failure_of(RpcClient& client, const std::string& method, const nlohmann::json& params) {
    try {
        call_node(client, method, params);
    } catch (const NodeError& e) {
        return e.errc();
    }
    FAIL("node call did not fail");
    return NodeErrc{};
}
} // namespace

TEST_CASE("RpcClient::call returns the result member", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    std::vector<std::string> sent;
    EXPECT_CALL(*transport, post(_)).Times(2).WillRepeatedly(Invoke([&sent](const std::string& body) {
        sent.push_back(body);
        return echo_reply(body, 200, R"({"result":{"height":812000},"error":null})"_json);
    }));
    RpcClient client{std::move(transport)};

    SECTION("request envelope and result") {
        const auto result = call_node(client, "getblock", nlohmann::json::array({"00ab", 2}));
        CHECK(result == R"({"height":812000})"_json);
        call_node(client, "getblock", nlohmann::json::array({"00ab", 2}));

        REQUIRE(sent.size() == 2);
        const auto first = nlohmann::json::parse(sent[0]);
        CHECK(first["jsonrpc"] == "2.0");
        CHECK(first["method"] == "getblock");
        CHECK(first["params"] == R"(["00ab", 2])"_json);
        const auto second = nlohmann::json::parse(sent[1]);
        CHECK(first["id"].is_string());
        CHECK(first["id"] != second["id"]);
    }
}

TEST_CASE("RpcClient::call prefers result over error", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    EXPECT_CALL(*transport, post(_)).WillOnce(Invoke([](const std::string& body) {
        return echo_reply(body, 200, R"({"result":7,"error":{"code":-1,"message":"ignored"}})"_json);
    }));
    RpcClient client{std::move(transport)};

    CHECK(call_node(client, "getblockcount", nlohmann::json::array()) == 7);
}

TEST_CASE("RpcClient::call accepts null response id", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    EXPECT_CALL(*transport, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
        return raw_reply(200, R"({"result":"0000abcd","error":null,"id":null})");
    }));
    RpcClient client{std::move(transport)};

    CHECK(call_node(client, "getblockhash", nlohmann::json::array({0})) == "0000abcd");
}

TEST_CASE("RpcClient::call fails with rpc_failure", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    auto* mock = transport.get();
    RpcClient client{std::move(transport)};

    SECTION("error member is reported") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& body) {
            return echo_reply(body, 200, R"({"result":null,"error":{"code":-5,"message":"Block not found"}})"_json);
        }));
        CHECK_THROWS_MATCHES(call_node(client, "getblock", nlohmann::json::array({"00ab", 2})), NodeError,
            Catch::Matchers::Predicate<NodeError>([](const NodeError& e) {
                return e.errc() == NodeErrc::rpc_failure && std::string{e.what()}.find("Block not found") != std::string::npos;
            }));
    }

    SECTION("neither result nor error") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& body) {
            return echo_reply(body, 200, nlohmann::json::object());
        }));
        CHECK_THROWS_MATCHES(call_node(client, "getblockcount", nlohmann::json::array()), NodeError,
            Catch::Matchers::Predicate<NodeError>([](const NodeError& e) {
                return e.errc() == NodeErrc::rpc_failure && std::string{e.what()}.find("unknown error") != std::string::npos;
            }));
    }
}

TEST_CASE("RpcClient::call fails with http_status", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    auto* mock = transport.get();
    RpcClient client{std::move(transport)};

    SECTION("body is kept") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
            return raw_reply(401, "Unauthorized");
        }));
        try {
            call_node(client, "getblockcount", nlohmann::json::array());
            FAIL("node call did not fail");
        } catch (const NodeError& e) {
            CHECK(e.errc() == NodeErrc::http_status);
            CHECK(e.http_status() == 401);
            CHECK(e.detail() == "Unauthorized");
        }
    }

    SECTION("empty body gets placeholder") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
            return raw_reply(503, "");
        }));
        try {
            call_node(client, "getblockcount", nlohmann::json::array());
            FAIL("node call did not fail");
        } catch (const NodeError& e) {
            CHECK(e.errc() == NodeErrc::http_status);
            CHECK(e.http_status() == 503);
            CHECK(e.detail() == "<unreadable response body>");
        }
    }
}

TEST_CASE("RpcClient::call fails with malformed_response", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    auto* mock = transport.get();
    RpcClient client{std::move(transport)};

    SECTION("body is not JSON") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
            return raw_reply(200, "<html>gateway</html>");
        }));
        CHECK(failure_of(client, "getblockcount", nlohmann::json::array()) == NodeErrc::malformed_response);
    }

    SECTION("body is not an object") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
            return raw_reply(200, "[1,2,3]");
        }));
        CHECK(failure_of(client, "getblockcount", nlohmann::json::array()) == NodeErrc::malformed_response);
    }

    SECTION("response id differs from request id") {
        EXPECT_CALL(*mock, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
            return raw_reply(200, R"({"result":1,"error":null,"id":"not-my-id"})");
        }));
        CHECK(failure_of(client, "getblockcount", nlohmann::json::array()) == NodeErrc::malformed_response);
    }
}

TEST_CASE("RpcClient::call logs unparsable response body", "[blockgate][node][rpc_client]") {
    std::ostringstream out;
    std::ostringstream err;
    BLOCKGATE_LOG_STREAMS(out, err);
    BLOCKGATE_LOG_VERBOSITY(LogLevel::Error);

    auto transport = std::make_unique<test::MockTransport>();
    EXPECT_CALL(*transport, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
        return raw_reply(200, "<html>node maintenance</html>");
    }));
    RpcClient client{std::move(transport)};

    CHECK(failure_of(client, "getblockhash", nlohmann::json::array({812000})) == NodeErrc::malformed_response);
    CHECK_THAT(err.str(), Catch::Matchers::Contains("ERROR") && Catch::Matchers::Contains("getblockhash") &&
                          Catch::Matchers::Contains("<html>node maintenance</html>"));

    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);
    BLOCKGATE_LOG_STREAMS(null_stream(), null_stream());
}

TEST_CASE("RpcClient::call fails with connection_failed", "[blockgate][node][rpc_client]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    auto transport = std::make_unique<test::MockTransport>();
    EXPECT_CALL(*transport, post(_)).WillOnce(Invoke([](const std::string& /*body*/) {
        return refused_reply();
    }));
    RpcClient client{std::move(transport)};

    CHECK(failure_of(client, "getblockcount", nlohmann::json::array()) == NodeErrc::connection_failed);
}

} // namespace blockgate::node
