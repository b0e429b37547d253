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

#include "error.hpp"

#include <catch2/catch.hpp>

namespace blockgate::node {

using Catch::Matchers::Contains;

TEST_CASE("node error codes", "[blockgate][node][error]") {
    const std::error_code ec = NodeErrc::connection_failed;
    CHECK(ec.category().name() == std::string{"node"});
    CHECK(ec.value() == 100);
    CHECK(make_error_code(NodeErrc::http_status).message() == "node replied with HTTP error status");
    CHECK(make_error_code(NodeErrc::malformed_response).message() == "node replied with malformed JSON-RPC response");
    CHECK(make_error_code(NodeErrc::rpc_failure).message() == "node replied with JSON-RPC error");
    CHECK(make_error_code(static_cast<NodeErrc>(0)).message() == "unknown node error");
}

TEST_CASE("node error exception", "[blockgate][node][error]") {
    SECTION("with detail and status") {
        const NodeError error{NodeErrc::http_status, "getblock failed", "Unauthorized", 401};
        CHECK(error.errc() == NodeErrc::http_status);
        CHECK(error.code() == NodeErrc::http_status);
        CHECK(error.detail() == "Unauthorized");
        CHECK(error.http_status() == 401);
        CHECK_THAT(std::string{error.what()}, Contains("getblock failed"));
    }

    SECTION("without detail") {
        const NodeError error{NodeErrc::rpc_failure, "unknown error"};
        CHECK(error.errc() == NodeErrc::rpc_failure);
        CHECK(error.detail().empty());
        CHECK(error.http_status() == 0);
    }

    SECTION("caught as std::system_error") {
        try {
            throw NodeError{NodeErrc::connection_failed, "connection refused"};
        } catch (const std::system_error& se) {
            CHECK(se.code() == NodeErrc::connection_failed);
        }
    }
}

} // namespace blockgate::node
