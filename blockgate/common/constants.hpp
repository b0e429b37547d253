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

#ifndef BLOCKGATE_COMMON_CONSTANTS_HPP_
#define BLOCKGATE_COMMON_CONSTANTS_HPP_

#include <cstddef>

namespace blockgate {

constexpr const char* kDefaultConfigFile{"blockgate.json"};

constexpr const char* kJsonRpcVersion{"2.0"};
constexpr const char* kUserAgent{"blockgate/0.1.0"};

constexpr const char* kHttpScheme{"http"};
constexpr const char* kDefaultHttpPort{"80"};
constexpr const char* kSchemeSeparator{"://"};
constexpr const char* kAddressPortSeparator{":"};
constexpr const char* kPathSeparator{"/"};

constexpr const char* kSkippedBlocksHeader{"X-Skipped-Blocks"};

constexpr const std::size_t kLatestBlocksWindowSize{10};

constexpr const std::size_t kHashHexLength{64};

constexpr const std::size_t kMaxNodeResponseSize{64 * 1024 * 1024};

constexpr const std::size_t kHttpIncomingBufferSize{8192};
constexpr const std::size_t kMaxRequestContentSize{64 * 1024};
constexpr const std::size_t kMaxRequestHeaderSize{16 * 1024};

constexpr const std::size_t kRequestContentInitialCapacity{1024};
constexpr const std::size_t kRequestHeadersInitialCapacity{8};
constexpr const std::size_t kRequestMethodInitialCapacity{64};
constexpr const std::size_t kRequestUriInitialCapacity{64};

} // namespace blockgate

#endif  // BLOCKGATE_COMMON_CONSTANTS_HPP_
