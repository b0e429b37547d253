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

#include "identifiers.hpp"

#include <algorithm>

#include <absl/strings/ascii.h>

#include <blockgate/common/constants.hpp>

namespace blockgate::core {

static bool is_hex_hash(std::string_view value) {
    if (value.size() != kHashHexLength) {
        return false;
    }
    return std::all_of(value.cbegin(), value.cend(), [](char c) { return absl::ascii_isxdigit(static_cast<unsigned char>(c)); });
}

bool is_valid_block_hash(std::string_view hash) {
    return is_hex_hash(hash);
}

bool is_valid_transaction_id(std::string_view txid) {
    return is_hex_hash(txid);
}

} // namespace blockgate::core
