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

#include "tx_api.hpp"

#include <exception>

#include <nlohmann/json.hpp>

#include <blockgate/commands/rest_reply.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/core/identifiers.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/node/methods.hpp>

namespace blockgate::commands {

constexpr const char* kInvalidTransactionId{"Invalid transaction id"};
constexpr const char* kTransactionFailure{"Failed to retrieve transaction information"};

// GET /tx/{txid}, decoded with verbose output
boost::asio::awaitable<void> TxRestApi::handle_get_transaction(const std::string& txid, http::Reply& reply) {
    if (!core::is_valid_transaction_id(txid)) {
        BLOCKGATE_DEBUG << "handle_get_transaction invalid txid: " << txid << "\n";
        make_text_reply(reply, http::Reply::bad_request, kInvalidTransactionId);
        co_return;
    }

    try {
        const auto params = nlohmann::json::array({txid, true});
        const auto transaction = co_await client_->call(node::method::k_getrawtransaction, params);
        make_json_reply(reply, http::Reply::ok, transaction);
    } catch (const node::NodeError& e) {
        BLOCKGATE_ERROR << "handle_get_transaction txid: " << txid << " failed: " << e.what() << " detail: " << e.detail() << "\n";
        make_text_reply(reply, http::Reply::internal_server_error, kTransactionFailure);
    } catch (const std::exception& e) {
        BLOCKGATE_ERROR << "handle_get_transaction txid: " << txid << " exception: " << e.what() << "\n";
        make_text_reply(reply, http::Reply::internal_server_error, kTransactionFailure);
    }
}

} // namespace blockgate::commands
