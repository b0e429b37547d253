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

#include "latest_blocks.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <blockgate/common/log.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/test/mock_node_client.hpp>

namespace blockgate::core {

using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;

namespace {
//! Simulated node whose block at height N has hash "hash-N"
boost::asio::awaitable<nlohmann::json> chain_reply(std::string method, nlohmann::json params, int64_t count,
                                                   std::set<int64_t> failing_hashes, std::set<int64_t> failing_blocks) {
    if (method == "getblockcount") {
        co_return count;
    }
    if (method == "getblockhash") {
        const auto height = params.at(0).get<int64_t>();
        if (failing_hashes.count(height) != 0) {
            throw node::NodeError{node::NodeErrc::rpc_failure, "Block height out of range"};
        }
        co_return "hash-" + std::to_string(height);
    }
    if (method == "getblock") {
        const auto hash = params.at(0).get<std::string>();
        const auto height = std::stoll(hash.substr(5));
        if (failing_blocks.count(height) != 0) {
            throw node::NodeError{node::NodeErrc::connection_failed, "cannot reach node"};
        }
        co_return nlohmann::json{{"hash", hash}, {"height", height}};
    }
    throw node::NodeError{node::NodeErrc::rpc_failure, "Method not found"};
}

void expect_chain(test::MockNodeClient& client, int64_t count, std::set<int64_t> failing_hashes = {},
                  std::set<int64_t> failing_blocks = {}) {
    EXPECT_CALL(client, call(_, _)).WillRepeatedly(Invoke(
        [=](const std::string& method, const nlohmann::json& params) {
            return chain_reply(method, params, count, failing_hashes, failing_blocks);
        }));
}

LatestBlocks run_latest_blocks(node::Client& client) {
    boost::asio::io_context io_context;
    auto result{boost::asio::co_spawn(io_context, get_latest_blocks(client), boost::asio::use_future)};
    io_context.run();
    return result.get();
}

std::vector<int64_t> heights_of(const LatestBlocks& latest) {
    std::vector<int64_t> heights;
    for (const auto& block : latest.blocks) {
        heights.push_back(block["height"].get<int64_t>());
    }
    return heights;
}
} // namespace

TEST_CASE("get_latest_blocks returns the window from the tip", "[blockgate][core][latest_blocks]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    test::MockNodeClient client;
    expect_chain(client, 812000);

    const auto latest = run_latest_blocks(client);
    CHECK(latest.skipped == 0);
    CHECK(heights_of(latest) == std::vector<int64_t>{812000, 811999, 811998, 811997, 811996,
                                                     811995, 811994, 811993, 811992, 811991});
    CHECK(latest.blocks[0] == R"({"hash":"hash-812000","height":812000})"_json);
}

TEST_CASE("get_latest_blocks stops at genesis on a short chain", "[blockgate][core][latest_blocks]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    test::MockNodeClient client;

    SECTION("chain height 3") {
        expect_chain(client, 3);
        const auto latest = run_latest_blocks(client);
        CHECK(latest.skipped == 0);
        CHECK(heights_of(latest) == std::vector<int64_t>{3, 2, 1, 0});
    }

    SECTION("genesis only") {
        expect_chain(client, 0);
        const auto latest = run_latest_blocks(client);
        CHECK(heights_of(latest) == std::vector<int64_t>{0});
    }
}

TEST_CASE("get_latest_blocks skips heights whose fetch fails", "[blockgate][core][latest_blocks]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    test::MockNodeClient client;

    SECTION("getblockhash failure") {
        expect_chain(client, 20, {17});
        const auto latest = run_latest_blocks(client);
        CHECK(latest.skipped == 1);
        CHECK(heights_of(latest) == std::vector<int64_t>{20, 19, 18, 16, 15, 14, 13, 12, 11});
    }

    SECTION("getblock failure") {
        expect_chain(client, 20, {}, {20, 11});
        const auto latest = run_latest_blocks(client);
        CHECK(latest.skipped == 2);
        CHECK(heights_of(latest) == std::vector<int64_t>{19, 18, 17, 16, 15, 14, 13, 12});
    }

    SECTION("every fetch fails") {
        expect_chain(client, 4, {4, 3, 2, 1, 0});
        const auto latest = run_latest_blocks(client);
        CHECK(latest.skipped == 5);
        CHECK(latest.blocks.empty());
    }
}

TEST_CASE("get_latest_blocks fails if block count is unavailable", "[blockgate][core][latest_blocks]") {
    BLOCKGATE_LOG_VERBOSITY(LogLevel::None);

    test::MockNodeClient client;
    EXPECT_CALL(client, call("getblockhash", _)).Times(0);
    EXPECT_CALL(client, call("getblock", _)).Times(0);

    SECTION("node error") {
        EXPECT_CALL(client, call("getblockcount", _)).WillOnce(InvokeWithoutArgs([]() {
            return test::node_failure(node::NodeErrc::http_status, "HTTP status 401");
        }));
        CHECK_THROWS_AS(run_latest_blocks(client), node::NodeError);
    }

    SECTION("count is not an integer") {
        EXPECT_CALL(client, call("getblockcount", _)).WillOnce(InvokeWithoutArgs([]() {
            return test::node_result("812000");
        }));
        try {
            run_latest_blocks(client);
            FAIL("get_latest_blocks did not fail");
        } catch (const node::NodeError& e) {
            CHECK(e.errc() == node::NodeErrc::malformed_response);
        }
    }

    SECTION("count above the signed range") {
        EXPECT_CALL(client, call("getblockcount", _)).WillOnce(InvokeWithoutArgs([]() {
            return test::node_result(nlohmann::json(std::numeric_limits<uint64_t>::max()));
        }));
        try {
            run_latest_blocks(client);
            FAIL("get_latest_blocks did not fail");
        } catch (const node::NodeError& e) {
            CHECK(e.errc() == node::NodeErrc::malformed_response);
        }
    }

    SECTION("count is negative") {
        EXPECT_CALL(client, call("getblockcount", _)).WillOnce(InvokeWithoutArgs([]() {
            return test::node_result(nlohmann::json(int64_t{-1}));
        }));
        try {
            run_latest_blocks(client);
            FAIL("get_latest_blocks did not fail");
        } catch (const node::NodeError& e) {
            CHECK(e.errc() == node::NodeErrc::malformed_response);
        }
    }
}

} // namespace blockgate::core
