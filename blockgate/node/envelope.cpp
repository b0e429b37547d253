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

#include "envelope.hpp"

#include <stdexcept>

#include <blockgate/common/constants.hpp>
#include <blockgate/node/error.hpp>

namespace blockgate::node {

constexpr const char* kUnknownError{"unknown error"};

nlohmann::json make_json_request(const std::string& id, const std::string& method, const nlohmann::json& params) {
    if (!params.is_array()) {
        throw std::invalid_argument{"JSON-RPC params must be an array, got: " + params.dump()};
    }
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"method", method},
        {"params", params},
    };
}

static std::optional<nlohmann::json> optional_member(const nlohmann::json& object, const char* name) {
    const auto it = object.find(name);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

Outcome parse_outcome(const std::string& body) {
    const auto json = nlohmann::json::parse(body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        throw NodeError{NodeErrc::malformed_response, "invalid JSON in response", body};
    }
    if (!json.is_object()) {
        throw NodeError{NodeErrc::malformed_response, "response is not a JSON object", body};
    }
    return Outcome{optional_member(json, "result"), optional_member(json, "error"), optional_member(json, "id")};
}

std::string make_error_message(const Outcome& outcome) {
    if (!outcome.error) {
        return kUnknownError;
    }
    return outcome.error->dump(/*indent=*/-1, /*indent_char=*/' ', /*ensure_ascii=*/false, nlohmann::json::error_handler_t::replace);
}

} // namespace blockgate::node
