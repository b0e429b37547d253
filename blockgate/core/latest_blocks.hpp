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

#ifndef BLOCKGATE_CORE_LATEST_BLOCKS_HPP_
#define BLOCKGATE_CORE_LATEST_BLOCKS_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <blockgate/common/constants.hpp>
#include <blockgate/node/client.hpp>

namespace blockgate::core {

struct LatestBlocks {
    //! Block details ordered from the chain tip downwards
    std::vector<nlohmann::json> blocks;

    //! Number of heights in the window whose hash or block could not be fetched
    std::size_t skipped{0};
};

//! Current chain height, throws node::NodeError if the node fails or does not reply with an integer
boost::asio::awaitable<int64_t> get_block_count(node::Client& client);

//! Fetch at most \p window_size blocks starting from the tip, skipping the heights whose fetch fails.
//! Only a failure of the height query is propagated.
boost::asio::awaitable<LatestBlocks> get_latest_blocks(node::Client& client, std::size_t window_size = kLatestBlocksWindowSize);

} // namespace blockgate::core

#endif  // BLOCKGATE_CORE_LATEST_BLOCKS_HPP_
