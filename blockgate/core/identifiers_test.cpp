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

#include <string>

#include <catch2/catch.hpp>

namespace blockgate::core {

static const std::string kGenesisHash{"000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f"};

TEST_CASE("is_valid_block_hash", "[blockgate][core][identifiers]") {
    CHECK(is_valid_block_hash(kGenesisHash));
    CHECK(is_valid_block_hash("000000000019D6689C085AE165831E934FF763AE46A2A6C172B3F1B60A8CE26F"));

    CHECK_FALSE(is_valid_block_hash(""));
    CHECK_FALSE(is_valid_block_hash("abc"));
    CHECK_FALSE(is_valid_block_hash(kGenesisHash.substr(1)));
    CHECK_FALSE(is_valid_block_hash(kGenesisHash + "0"));
    CHECK_FALSE(is_valid_block_hash("0x" + kGenesisHash.substr(2)));
    CHECK_FALSE(is_valid_block_hash("g" + kGenesisHash.substr(1)));
    CHECK_FALSE(is_valid_block_hash(kGenesisHash.substr(0, 63) + " "));
}

TEST_CASE("is_valid_transaction_id", "[blockgate][core][identifiers]") {
    CHECK(is_valid_transaction_id("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b"));

    CHECK_FALSE(is_valid_transaction_id("not-a-txid"));
    CHECK_FALSE(is_valid_transaction_id("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33"));
    CHECK_FALSE(is_valid_transaction_id("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33z"));
}

} // namespace blockgate::core
