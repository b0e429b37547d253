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

#ifndef BLOCKGATE_HTTP_SERVER_HPP_
#define BLOCKGATE_HTTP_SERVER_HPP_

#include <string>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <blockgate/commands/rest_api_table.hpp>
#include <blockgate/concurrency/context_pool.hpp>

namespace blockgate::http {

/// The top-level class of the HTTP server.
class Server {
public:
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Construct the server to listen on the specified local TCP end-point
    explicit Server(const std::string& host, const std::string& port, ContextPool& context_pool);

    void start();

    void stop();

    // The local end-point actually bound, useful when port 0 is requested
    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    boost::asio::awaitable<void> run();

    // The pool of contexts serving the connections
    ContextPool& context_pool_;

    // The acceptor used to listen for incoming TCP connections
    boost::asio::ip::tcp::acceptor acceptor_;

    // The repository of REST API request handlers
    commands::RestApiTable handler_table_;
};

} // namespace blockgate::http

#endif // BLOCKGATE_HTTP_SERVER_HPP_
