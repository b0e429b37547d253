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

#ifndef BLOCKGATE_NODE_METHODS_HPP_
#define BLOCKGATE_NODE_METHODS_HPP_

namespace blockgate::node::method {

constexpr const char* k_getblock{"getblock"};
constexpr const char* k_getblockcount{"getblockcount"};
constexpr const char* k_getblockhash{"getblockhash"};
constexpr const char* k_getrawtransaction{"getrawtransaction"};

} // namespace blockgate::node::method

#endif  // BLOCKGATE_NODE_METHODS_HPP_
