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

#ifndef BLOCKGATE_COMMANDS_REST_API_HPP_
#define BLOCKGATE_COMMANDS_REST_API_HPP_

#include <blockgate/commands/block_api.hpp>
#include <blockgate/commands/tx_api.hpp>
#include <blockgate/concurrency/context_pool.hpp>

namespace blockgate::http { class RequestHandler; }

namespace blockgate::commands {

class RestApiTable;

class RestApi : protected BlockRestApi, TxRestApi {
public:
    explicit RestApi(Context& context) : BlockRestApi{context.node_client()}, TxRestApi{context.node_client()} {}
    virtual ~RestApi() {}

    RestApi(const RestApi&) = delete;
    RestApi& operator=(const RestApi&) = delete;

    friend class RestApiTable;
    friend class blockgate::http::RequestHandler;
};

} // namespace blockgate::commands

#endif  // BLOCKGATE_COMMANDS_REST_API_HPP_
