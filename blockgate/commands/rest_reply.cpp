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

#include "rest_reply.hpp"

#include <utility>

namespace blockgate::commands {

static void set_content(http::Reply& reply, http::Reply::StatusType status, std::string content, const char* content_type) {
    reply.status = status;
    reply.content = std::move(content);
    reply.headers.clear();
    reply.headers.emplace_back(http::Header{"Content-Length", std::to_string(reply.content.size())});
    reply.headers.emplace_back(http::Header{"Content-Type", content_type});
}

void make_json_reply(http::Reply& reply, http::Reply::StatusType status, const nlohmann::json& content) {
    set_content(reply, status,
        content.dump(/*indent=*/-1, /*indent_char=*/' ', /*ensure_ascii=*/false, nlohmann::json::error_handler_t::replace),
        "application/json");
}

void make_text_reply(http::Reply& reply, http::Reply::StatusType status, const std::string& message) {
    set_content(reply, status, message, "text/plain");
}

} // namespace blockgate::commands
