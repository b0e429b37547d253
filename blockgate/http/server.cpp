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

#include "server.hpp"

#include <exception>
#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <blockgate/common/log.hpp>
#include <blockgate/http/connection.hpp>

namespace blockgate::http {

Server::Server(const std::string& host, const std::string& port, ContextPool& context_pool)
    : context_pool_(context_pool), acceptor_{context_pool.next_io_context()} {
    // Open the acceptor with the option to reuse the address (i.e. SO_REUSEADDR).
    boost::asio::ip::tcp::resolver resolver{acceptor_.get_executor()};
    boost::asio::ip::tcp::endpoint endpoint = *resolver.resolve(host, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    BLOCKGATE_DEBUG << "Server::Server listening at " << acceptor_.local_endpoint() << "\n";
}

void Server::start() {
    boost::asio::co_spawn(acceptor_.get_executor(), run(), [&](std::exception_ptr eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });
}

boost::asio::awaitable<void> Server::run() {
    try {
        while (acceptor_.is_open()) {
            // Get the next context to use chosen round-robin, then get both io_context *and* node client from it
            auto& context = context_pool_.next_context();
            auto* io_context = context.io_context();

            BLOCKGATE_DEBUG << "Server::run accepting using io_context " << io_context << "...\n" << std::flush;

            auto new_connection = std::make_shared<Connection>(context, handler_table_);
            co_await acceptor_.async_accept(new_connection->socket(), boost::asio::use_awaitable);
            if (!acceptor_.is_open()) {
                BLOCKGATE_TRACE << "Server::run returning...\n";
                co_return;
            }

            new_connection->socket().set_option(boost::asio::ip::tcp::socket::keep_alive(true));

            BLOCKGATE_TRACE << "Server::run starting connection for socket: " << &new_connection->socket() << "\n";
            auto new_connection_starter = [=]() -> boost::asio::awaitable<void> { co_await new_connection->start(); };

            // https://github.com/chriskohlhoff/asio/issues/552
            boost::asio::dispatch(*io_context, [=]() mutable {
                boost::asio::co_spawn(*io_context, new_connection_starter, [](std::exception_ptr eptr) {
                    if (eptr) std::rethrow_exception(eptr);
                });
            });
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::asio::error::operation_aborted) {
            BLOCKGATE_ERROR << "Server::run system_error: " << se.what() << "\n" << std::flush;
            throw;
        } else {
            BLOCKGATE_DEBUG << "Server::run operation_aborted: " << se.what() << "\n" << std::flush;
        }
    }
    BLOCKGATE_DEBUG << "Server::run exiting...\n" << std::flush;
}

void Server::stop() {
    // The server is stopped by cancelling all outstanding asynchronous operations.
    BLOCKGATE_DEBUG << "Server::stop started...\n";
    boost::asio::dispatch(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            BLOCKGATE_WARN << "Server::stop acceptor close failed: " << ec.message() << "\n";
        }
    });
    BLOCKGATE_DEBUG << "Server::stop completed\n" << std::flush;
}

} // namespace blockgate::http
