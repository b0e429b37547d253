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

#include "request_handler.hpp"

#include <exception>

#include <blockgate/common/clock_time.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/http/header.hpp>

namespace blockgate::http {

boost::asio::awaitable<void> RequestHandler::handle_request(const http::Request& request, http::Reply& reply) {
    BLOCKGATE_DEBUG << "handle_request method: " << request.method << " uri: " << request.uri << "\n";
    auto start = clock_time::now();

    const auto route = rest_api_table_.find_handler(request.uri);
    if (!route) {
        BLOCKGATE_DEBUG << "handle_request no resource for uri: " << request.uri << "\n";
        reply = http::Reply::stock_reply(http::Reply::not_found);
        BLOCKGATE_INFO << "handle_request " << request.method << " " << request.uri << " status=" << reply.status
                       << " t=" << clock_time::since(start) << "ns\n";
        co_return;
    }

    if (request.method != "GET") {
        BLOCKGATE_DEBUG << "handle_request method " << request.method << " not allowed for uri: " << request.uri << "\n";
        reply = http::Reply::stock_reply(http::Reply::method_not_allowed);
        reply.headers.emplace_back(http::Header{"Allow", "GET"});
        BLOCKGATE_INFO << "handle_request " << request.method << " " << request.uri << " status=" << reply.status
                       << " t=" << clock_time::since(start) << "ns\n";
        co_return;
    }

    try {
        const auto handle_method = route->handle_method;
        co_await (rest_api_.*handle_method)(route->argument, reply);
    } catch (const std::exception& e) {
        BLOCKGATE_ERROR << "handle_request exception: " << e.what() << " uri: " << request.uri << "\n";
        reply = http::Reply::stock_reply(http::Reply::internal_server_error);
    }

    BLOCKGATE_INFO << "handle_request " << request.method << " " << request.uri << " status=" << reply.status
                   << " t=" << clock_time::since(start) << "ns\n";
    co_return;
}

} // namespace blockgate::http
