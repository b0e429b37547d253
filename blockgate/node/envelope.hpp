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

#ifndef BLOCKGATE_NODE_ENVELOPE_HPP_
#define BLOCKGATE_NODE_ENVELOPE_HPP_

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace blockgate::node {

//! Build the JSON-RPC 2.0 request envelope, \p params must be a JSON array
nlohmann::json make_json_request(const std::string& id, const std::string& method, const nlohmann::json& params);

//! The JSON-RPC response members we care about. JSON null counts as absent.
struct Outcome {
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;
    std::optional<nlohmann::json> id;
};

//! Parse a response body, throwing NodeError(malformed_response) if it is not a JSON object
Outcome parse_outcome(const std::string& body);

//! The diagnostic message for a response without result
std::string make_error_message(const Outcome& outcome);

} // namespace blockgate::node

#endif  // BLOCKGATE_NODE_ENVELOPE_HPP_
