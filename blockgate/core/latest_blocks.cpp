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

#include "latest_blocks.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include <blockgate/common/log.hpp>
#include <blockgate/node/error.hpp>
#include <blockgate/node/methods.hpp>

namespace blockgate::core {

boost::asio::awaitable<int64_t> get_block_count(node::Client& client) {
    const auto count = co_await client.call(node::method::k_getblockcount, nlohmann::json::array());
    if (!count.is_number_integer()) {
        throw node::NodeError{node::NodeErrc::malformed_response, "block count is not an integer", count.dump()};
    }
    if (count.is_number_unsigned() && count.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw node::NodeError{node::NodeErrc::malformed_response, "block count out of range", count.dump()};
    }
    if (count.get<int64_t>() < 0) {
        throw node::NodeError{node::NodeErrc::malformed_response, "block count is negative", count.dump()};
    }
    co_return count.get<int64_t>();
}

boost::asio::awaitable<LatestBlocks> get_latest_blocks(node::Client& client, std::size_t window_size) {
    const auto block_count = co_await get_block_count(client);
    BLOCKGATE_DEBUG << "get_latest_blocks block_count: " << block_count << " window_size: " << window_size << "\n";

    LatestBlocks latest;
    for (std::size_t i{0}; i < window_size; i++) {
        const auto height = block_count - static_cast<int64_t>(i);
        if (height < 0) {
            break;
        }

        std::optional<nlohmann::json> block_hash;
        try {
            const auto params = nlohmann::json::array({height});
            block_hash = co_await client.call(node::method::k_getblockhash, params);
        } catch (const node::NodeError& e) {
            BLOCKGATE_WARN << "get_latest_blocks skipping height: " << height << " getblockhash failed: " << e.what() << "\n";
            latest.skipped++;
            continue;
        }

        std::optional<nlohmann::json> block;
        try {
            const auto params = nlohmann::json::array({*block_hash});
            block = co_await client.call(node::method::k_getblock, params);
        } catch (const node::NodeError& e) {
            BLOCKGATE_WARN << "get_latest_blocks skipping height: " << height << " getblock failed: " << e.what() << "\n";
            latest.skipped++;
            continue;
        }

        latest.blocks.push_back(std::move(*block));
    }

    if (latest.skipped > 0) {
        BLOCKGATE_WARN << "get_latest_blocks returning " << latest.blocks.size() << " blocks, skipped: " << latest.skipped << "\n";
    }
    co_return latest;
}

} // namespace blockgate::core
