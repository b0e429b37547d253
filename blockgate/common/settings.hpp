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

#ifndef BLOCKGATE_COMMON_SETTINGS_HPP_
#define BLOCKGATE_COMMON_SETTINGS_HPP_

#include <cstdint>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include <blockgate/node/endpoint.hpp>

namespace blockgate {

//! Local HTTP binding of the gateway
struct ServerSettings {
    std::string host;
    uint16_t port{0};
};

//! The whole configuration file
struct GatewaySettings {
    node::NodeEndpoint rpc;
    ServerSettings server;
};

std::ostream& operator<<(std::ostream& out, const GatewaySettings& settings);

//! Validate the configuration document, throwing std::runtime_error naming the offending key
GatewaySettings parse_settings(const nlohmann::json& config);

//! Read and validate the JSON configuration file at \p path
GatewaySettings load_settings(const std::string& path);

} // namespace blockgate

#endif  // BLOCKGATE_COMMON_SETTINGS_HPP_
