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

#include "block_api.hpp"

#include <exception>

#include <nlohmann/json.hpp>

#include <blockgate/commands/rest_reply.hpp>
#include <blockgate/common/constants.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/core/identifiers.hpp>
#include <blockgate/core/latest_blocks.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/node/methods.hpp>

namespace blockgate::commands {

constexpr const char* kInvalidBlockHash{"Invalid block hash"};
constexpr const char* kBlockFailure{"Failed to retrieve block information"};
constexpr const char* kLatestBlocksFailure{"Failed to retrieve latest blocks"};

// GET /block/{hash}
boost::asio::awaitable<void> BlockRestApi::handle_get_block(const std::string& hash, http::Reply& reply) {
    if (!core::is_valid_block_hash(hash)) {
        BLOCKGATE_DEBUG << "handle_get_block invalid hash: " << hash << "\n";
        make_text_reply(reply, http::Reply::bad_request, kInvalidBlockHash);
        co_return;
    }

    try {
        const auto params = nlohmann::json::array({hash});
        const auto block = co_await client_->call(node::method::k_getblock, params);
        make_json_reply(reply, http::Reply::ok, block);
    } catch (const node::NodeError& e) {
        BLOCKGATE_ERROR << "handle_get_block hash: " << hash << " failed: " << e.what() << " detail: " << e.detail() << "\n";
        make_text_reply(reply, http::Reply::internal_server_error, kBlockFailure);
    } catch (const std::exception& e) {
        BLOCKGATE_ERROR << "handle_get_block hash: " << hash << " exception: " << e.what() << "\n";
        make_text_reply(reply, http::Reply::internal_server_error, kBlockFailure);
    }
}

// GET /latest_blocks
boost::asio::awaitable<void> BlockRestApi::handle_get_latest_blocks(const std::string& /*argument*/, http::Reply& reply) {
    try {
        const auto latest = co_await core::get_latest_blocks(*client_);
        make_json_reply(reply, http::Reply::ok, latest.blocks);
        reply.headers.emplace_back(http::Header{kSkippedBlocksHeader, std::to_string(latest.skipped)});
    } catch (const node::NodeError& e) {
        BLOCKGATE_ERROR << "handle_get_latest_blocks failed: " << e.what() << " detail: " << e.detail() << "\n";
        make_text_reply(reply, http::Reply::internal_server_error, kLatestBlocksFailure);
    } catch (const std::exception& e) {
        BLOCKGATE_ERROR << "handle_get_latest_blocks exception: " << e.what() << "\n";
        make_text_reply(reply, http::Reply::internal_server_error, kLatestBlocksFailure);
    }
}

} // namespace blockgate::commands
