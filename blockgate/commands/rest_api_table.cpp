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

#include "rest_api_table.hpp"

#include <cstring>

#include <blockgate/common/constants.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/http/routes.hpp>

namespace blockgate::commands {

RestApiTable::RestApiTable() {
    add_block_handlers();
    add_tx_handlers();
}

std::optional<RestApiTable::Route> RestApiTable::find_handler(const std::string& target) const {
    const auto path = target.substr(0, target.find('?'));
    if (path.rfind(kPathSeparator, 0) != 0) {
        return std::nullopt;
    }

    const auto start = std::strlen(kPathSeparator);
    const auto end = path.find(kPathSeparator, start);
    const auto resource = path.substr(start, end == std::string::npos ? std::string::npos : end - start);

    const auto handle_method_pair = handlers_.find(resource);
    if (handle_method_pair == handlers_.end()) {
        return std::nullopt;
    }
    const auto& [handle_method, with_argument] = handle_method_pair->second;
    if (with_argument != (end != std::string::npos)) {
        BLOCKGATE_TRACE << "RestApiTable::find_handler path " << path << " does not match resource " << resource << "\n";
        return std::nullopt;
    }

    std::string argument;
    if (with_argument) {
        argument = path.substr(end + std::strlen(kPathSeparator));
    }
    return Route{handle_method, argument};
}

void RestApiTable::add_block_handlers() {
    handlers_[http::route::k_block] = {&commands::RestApi::handle_get_block, true};
    handlers_[http::route::k_latest_blocks] = {&commands::RestApi::handle_get_latest_blocks, false};
}

void RestApiTable::add_tx_handlers() {
    handlers_[http::route::k_tx] = {&commands::RestApi::handle_get_transaction, true};
}

} // namespace blockgate::commands
