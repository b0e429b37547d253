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

#ifndef BLOCKGATE_COMMANDS_REST_API_TABLE_HPP_
#define BLOCKGATE_COMMANDS_REST_API_TABLE_HPP_

#include <map>
#include <optional>
#include <string>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>

#include <blockgate/commands/rest_api.hpp>
#include <blockgate/http/reply.hpp>

namespace blockgate::commands {

class RestApiTable {
public:
    typedef boost::asio::awaitable<void> (RestApi::*HandleMethod)(const std::string&, http::Reply&);

    //! The handler matching a request target together with its path argument
    struct Route {
        HandleMethod handle_method;
        std::string argument;
    };

    RestApiTable();

    RestApiTable(const RestApiTable&) = delete;
    RestApiTable& operator=(const RestApiTable&) = delete;

    //! Match the path of \p target (query string ignored) against the known resources
    std::optional<Route> find_handler(const std::string& target) const;

private:
    struct Resource {
        HandleMethod handle_method;
        bool with_argument;
    };

    void add_block_handlers();
    void add_tx_handlers();

    std::map<std::string, Resource> handlers_;
};

} // namespace blockgate::commands

#endif  // BLOCKGATE_COMMANDS_REST_API_TABLE_HPP_
