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

#include "connection.hpp"

#include <tuple>

#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <blockgate/common/log.hpp>
#include <blockgate/http/header.hpp>

namespace blockgate::http {

Connection::Connection(Context& context, const commands::RestApiTable& handler_table)
    : socket_{*context.io_context()}, request_handler_{context, handler_table}, buffer_{} {
    request_.content.reserve(kRequestContentInitialCapacity);
    request_.headers.reserve(kRequestHeadersInitialCapacity);
    request_.method.reserve(kRequestMethodInitialCapacity);
    request_.uri.reserve(kRequestUriInitialCapacity);
    BLOCKGATE_TRACE << "Connection::Connection socket " << &socket_ << " created\n";
}

Connection::~Connection() {
    BLOCKGATE_TRACE << "Connection::~Connection socket " << &socket_ << " deleted\n";
}

boost::asio::awaitable<void> Connection::start() {
    try {
        co_await do_read();
    } catch (const boost::system::system_error& se) {
        if (se.code() == boost::asio::error::eof || se.code() == boost::asio::error::connection_reset ||
            se.code() == boost::asio::error::operation_aborted) {
            BLOCKGATE_DEBUG << "Connection::start socket " << &socket_ << " closed: " << se.code().message() << "\n";
        } else {
            BLOCKGATE_WARN << "Connection::start socket " << &socket_ << " system_error: " << se.what() << "\n";
        }
    }

    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec) {
        BLOCKGATE_TRACE << "Connection::start socket " << &socket_ << " shutdown: " << ec.message() << "\n";
    }
    socket_.close(ec);
}

void Connection::clean() {
    request_.reset();
    request_parser_.reset();
    reply_.reset();
}

boost::asio::awaitable<void> Connection::do_read() {
    bool keep_alive{true};
    while (keep_alive) {
        clean();

        RequestParser::ResultType result{RequestParser::indeterminate};
        while (result == RequestParser::indeterminate) {
            std::size_t bytes_read = co_await socket_.async_read_some(boost::asio::buffer(buffer_), boost::asio::use_awaitable);
            BLOCKGATE_TRACE << "Connection::do_read bytes_read: " << bytes_read << "\n";
            std::tie(result, std::ignore) = request_parser_.parse(request_, buffer_.data(), buffer_.data() + bytes_read);
        }

        if (result == RequestParser::good) {
            co_await request_handler_.handle_request(request_, reply_);
            keep_alive = request_.keep_alive();
        } else {
            BLOCKGATE_DEBUG << "Connection::do_read malformed request on socket " << &socket_ << "\n";
            reply_ = Reply::stock_reply(Reply::bad_request);
            keep_alive = false;
        }
        reply_.headers.emplace_back(Header{"Connection", keep_alive ? "keep-alive" : "close"});

        co_await do_write();
    }
}

boost::asio::awaitable<void> Connection::do_write() {
    const auto bytes_written = co_await boost::asio::async_write(socket_, reply_.to_buffers(), boost::asio::use_awaitable);
    BLOCKGATE_TRACE << "Connection::do_write bytes_written: " << bytes_written << "\n";
}

} // namespace blockgate::http
