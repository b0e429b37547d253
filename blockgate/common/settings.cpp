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

#include "settings.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

#include <absl/strings/str_cat.h>

#include <blockgate/common/log.hpp>

namespace blockgate {

static const nlohmann::json& required_member(const nlohmann::json& object, const std::string& section, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        throw std::runtime_error{absl::StrCat("invalid configuration: missing ", section, ".", key)};
    }
    return *it;
}

static std::string required_string(const nlohmann::json& object, const std::string& section, const char* key) {
    const auto& value = required_member(object, section, key);
    if (!value.is_string()) {
        throw std::runtime_error{absl::StrCat("invalid configuration: ", section, ".", key, " must be a string")};
    }
    return value.get<std::string>();
}

static const nlohmann::json& required_section(const nlohmann::json& config, const std::string& section) {
    const auto it = config.find(section);
    if (it == config.end() || !it->is_object()) {
        throw std::runtime_error{absl::StrCat("invalid configuration: missing ", section, " section")};
    }
    return *it;
}

std::ostream& operator<<(std::ostream& out, const GatewaySettings& settings) {
    out << "rpc: " << settings.rpc << " server: " << settings.server.host << ":" << settings.server.port;
    return out;
}

GatewaySettings parse_settings(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw std::runtime_error{"invalid configuration: not a JSON object"};
    }

    GatewaySettings settings;

    const auto& rpc = required_section(config, "rpc");
    settings.rpc.url = required_string(rpc, "rpc", "url");
    settings.rpc.user = required_string(rpc, "rpc", "user");
    settings.rpc.password = required_string(rpc, "rpc", "pass");
    try {
        node::parse_url(settings.rpc.url);
    } catch (const std::invalid_argument& ia) {
        throw std::runtime_error{absl::StrCat("invalid configuration: rpc.url ", ia.what())};
    }

    const auto& server = required_section(config, "server");
    settings.server.host = required_string(server, "server", "host");
    if (settings.server.host.empty()) {
        throw std::runtime_error{"invalid configuration: server.host is empty"};
    }
    const auto& port = required_member(server, "server", "port");
    if (!port.is_number_integer()) {
        throw std::runtime_error{"invalid configuration: server.port must be an integer"};
    }
    const auto port_number = port.get<int64_t>();
    if (port_number < 1 || port_number > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error{absl::StrCat("invalid configuration: server.port out of range: ", port_number)};
    }
    settings.server.port = static_cast<uint16_t>(port_number);

    return settings;
}

GatewaySettings load_settings(const std::string& path) {
    std::ifstream config_file{path};
    if (!config_file.is_open()) {
        throw std::runtime_error{absl::StrCat("cannot open configuration file: ", path)};
    }

    const auto config = nlohmann::json::parse(config_file, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (config.is_discarded()) {
        throw std::runtime_error{absl::StrCat("invalid configuration: ", path, " is not valid JSON")};
    }

    auto settings = parse_settings(config);
    BLOCKGATE_DEBUG << "load_settings " << path << " " << settings << "\n";
    return settings;
}

} // namespace blockgate
