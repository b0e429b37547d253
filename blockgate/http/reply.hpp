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

#ifndef BLOCKGATE_HTTP_REPLY_HPP_
#define BLOCKGATE_HTTP_REPLY_HPP_

#include <string>
#include <vector>

#include <boost/asio/buffer.hpp>

#include <blockgate/http/header.hpp>

namespace blockgate::http {

/// A reply to be sent to a client.
struct Reply {
    /// The status of the reply.
    enum StatusType {
        ok = 200,
        bad_request = 400,
        not_found = 404,
        method_not_allowed = 405,
        internal_server_error = 500,
    } status;

    /// The headers to be included in the reply.
    std::vector<Header> headers;

    /// The content to be sent in the reply.
    std::string content;

    /// Convert the reply into a vector of buffers. The buffers do not own the
    /// underlying memory blocks, therefore the reply object must remain valid and
    /// not be changed until the write operation has completed.
    std::vector<boost::asio::const_buffer> to_buffers();

    /// Get a stock reply with plain text content.
    static Reply stock_reply(StatusType status);

    /// Value of the first header named \p name, empty if missing.
    std::string header(const std::string& name) const;

    void reset() {
        headers.clear();
        content.clear();
    }
};

} // namespace blockgate::http

#endif // BLOCKGATE_HTTP_REPLY_HPP_
