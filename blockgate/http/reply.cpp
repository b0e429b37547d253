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
//
// Copyright (c) 2003-2020 Christopher M. Kohlhoff (chris at kohlhoff dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "reply.hpp"

#include <string>

#include <blockgate/common/log.hpp>
#include <blockgate/common/util.hpp>

namespace blockgate::http {

namespace status_strings {

const std::string ok = "HTTP/1.1 200 OK\r\n";                                       // NOLINT(runtime/string)
const std::string bad_request = "HTTP/1.1 400 Bad Request\r\n";                     // NOLINT(runtime/string)
const std::string not_found = "HTTP/1.1 404 Not Found\r\n";                         // NOLINT(runtime/string)
const std::string method_not_allowed = "HTTP/1.1 405 Method Not Allowed\r\n";       // NOLINT(runtime/string)
const std::string internal_server_error = "HTTP/1.1 500 Internal Server Error\r\n"; // NOLINT(runtime/string)

boost::asio::const_buffer to_buffer(Reply::StatusType status) {
    switch (status) {
        case Reply::ok:
            return boost::asio::buffer(ok);
        case Reply::bad_request:
            return boost::asio::buffer(bad_request);
        case Reply::not_found:
            return boost::asio::buffer(not_found);
        case Reply::method_not_allowed:
            return boost::asio::buffer(method_not_allowed);
        case Reply::internal_server_error:
            return boost::asio::buffer(internal_server_error);
        default:
            return boost::asio::buffer(internal_server_error);
    }
}

} // namespace status_strings

namespace misc_strings {

const char name_value_separator[] = { ':', ' ' };
const char crlf[] = { '\r', '\n' };

} // namespace misc_strings

std::vector<boost::asio::const_buffer> Reply::to_buffers() {
    std::vector<boost::asio::const_buffer> buffers;
    buffers.reserve(1+headers.size()*4+2);
    buffers.push_back(status_strings::to_buffer(status));
    for (std::size_t i = 0; i < headers.size(); ++i) {
        Header& h = headers[i];
        buffers.push_back(boost::asio::buffer(h.name));
        buffers.push_back(boost::asio::buffer(misc_strings::name_value_separator));
        buffers.push_back(boost::asio::buffer(h.value));
        buffers.push_back(boost::asio::buffer(misc_strings::crlf));
    }
    buffers.push_back(boost::asio::buffer(misc_strings::crlf));
    buffers.push_back(boost::asio::buffer(content));
    BLOCKGATE_TRACE << "Reply::to_buffers buffers: " << buffers << "\n";
    return buffers;
}

std::string Reply::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (h.name == name) {
            return h.value;
        }
    }
    return {};
}

namespace stock_replies {

const char ok[] = "";
const char bad_request[] = "Bad Request";
const char not_found[] = "Not Found";
const char method_not_allowed[] = "Method Not Allowed";
const char internal_server_error[] = "Internal Server Error";

std::string to_string(Reply::StatusType status) {
    switch (status) {
        case Reply::ok:
            return ok;
        case Reply::bad_request:
            return bad_request;
        case Reply::not_found:
            return not_found;
        case Reply::method_not_allowed:
            return method_not_allowed;
        case Reply::internal_server_error:
            return internal_server_error;
        default:
            return internal_server_error;
    }
}

} // namespace stock_replies

Reply Reply::stock_reply(Reply::StatusType status) {
    Reply rep;
    rep.status = status;
    rep.content = stock_replies::to_string(status);
    rep.headers.reserve(2);
    rep.headers.emplace_back(Header{"Content-Length", std::to_string(rep.content.size())});
    rep.headers.emplace_back(Header{"Content-Type", "text/plain"});
    return rep;
}

} // namespace blockgate::http
