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

#ifndef BLOCKGATE_HTTP_ROUTES_HPP_
#define BLOCKGATE_HTTP_ROUTES_HPP_

namespace blockgate::http::route {

constexpr const char* k_block{"block"};
constexpr const char* k_tx{"tx"};
constexpr const char* k_latest_blocks{"latest_blocks"};

} // namespace blockgate::http::route

#endif  // BLOCKGATE_HTTP_ROUTES_HPP_
