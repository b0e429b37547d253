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

#ifndef BLOCKGATE_COMMANDS_REST_REPLY_HPP_
#define BLOCKGATE_COMMANDS_REST_REPLY_HPP_

#include <string>

#include <nlohmann/json.hpp>

#include <blockgate/http/reply.hpp>

namespace blockgate::commands {

//! Fill \p reply with \p content serialized as JSON
void make_json_reply(http::Reply& reply, http::Reply::StatusType status, const nlohmann::json& content);

//! Fill \p reply with the plain text \p message
void make_text_reply(http::Reply& reply, http::Reply::StatusType status, const std::string& message);

} // namespace blockgate::commands

#endif  // BLOCKGATE_COMMANDS_REST_REPLY_HPP_
