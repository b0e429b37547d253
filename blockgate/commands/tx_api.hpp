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

#ifndef BLOCKGATE_COMMANDS_TX_API_HPP_
#define BLOCKGATE_COMMANDS_TX_API_HPP_

#include <memory>
#include <string>

#include <blockgate/config.hpp> // NOLINT(build/include_order)

#include <boost/asio/awaitable.hpp>

#include <blockgate/http/reply.hpp>
#include <blockgate/node/client.hpp>

namespace blockgate::http { class RequestHandler; }

namespace blockgate::commands {

class TxRestApi {
public:
    explicit TxRestApi(std::unique_ptr<node::Client>& client) : client_(client) {}
    virtual ~TxRestApi() = default;

    TxRestApi(const TxRestApi&) = delete;
    TxRestApi& operator=(const TxRestApi&) = delete;

protected:
    boost::asio::awaitable<void> handle_get_transaction(const std::string& txid, http::Reply& reply);

private:
    friend class blockgate::http::RequestHandler;

    std::unique_ptr<node::Client>& client_;
};

} // namespace blockgate::commands

#endif  // BLOCKGATE_COMMANDS_TX_API_HPP_
