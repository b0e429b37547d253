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

#ifndef BLOCKGATE_HTTP_REQUEST_HANDLER_HPP_
#define BLOCKGATE_HTTP_REQUEST_HANDLER_HPP_

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>

#include <blockgate/commands/rest_api.hpp>
#include <blockgate/commands/rest_api_table.hpp>
#include <blockgate/concurrency/context_pool.hpp>
#include <blockgate/http/reply.hpp>
#include <blockgate/http/request.hpp>

namespace blockgate::http {

/// The common handler for all incoming requests.
class RequestHandler {
public:
    RequestHandler(Context& context, const commands::RestApiTable& rest_api_table)
        : rest_api_{context}, rest_api_table_(rest_api_table) {}

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /// Handle a request and produce a reply.
    boost::asio::awaitable<void> handle_request(const http::Request& request, http::Reply& reply);

private:
    commands::RestApi rest_api_;
    const commands::RestApiTable& rest_api_table_;
};

} // namespace blockgate::http

#endif // BLOCKGATE_HTTP_REQUEST_HANDLER_HPP_
