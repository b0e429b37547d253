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

#include <string>

namespace blockgate::node {

namespace {

struct NodeErrorCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
};

const char* NodeErrorCategory::name() const noexcept { return "node"; }

std::string NodeErrorCategory::message(int ev) const {
    switch (static_cast<NodeErrc>(ev)) {
        case NodeErrc::connection_failed:
            return "connection to node failed";
        case NodeErrc::http_status:
            return "node replied with HTTP error status";
        case NodeErrc::malformed_response:
            return "node replied with malformed JSON-RPC response";
        case NodeErrc::rpc_failure:
            return "node replied with JSON-RPC error";
    }
    return "unknown node error";
}

const NodeErrorCategory node_error_category{};

} // namespace

std::error_code make_error_code(NodeErrc errc) {
    return {static_cast<int>(errc), node_error_category};
}

} // namespace blockgate::node
