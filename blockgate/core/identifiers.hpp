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

#ifndef BLOCKGATE_CORE_IDENTIFIERS_HPP_
#define BLOCKGATE_CORE_IDENTIFIERS_HPP_

#include <string_view>

namespace blockgate::core {

//! A block hash is 32 bytes rendered as exactly 64 hexadecimal characters, no prefix
bool is_valid_block_hash(std::string_view hash);

//! A transaction id has the same shape as a block hash
bool is_valid_transaction_id(std::string_view txid);

} // namespace blockgate::core

#endif  // BLOCKGATE_CORE_IDENTIFIERS_HPP_
