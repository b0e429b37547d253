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

#include "http_transport.hpp"

#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <blockgate/common/clock_time.hpp>
#include <blockgate/common/constants.hpp>
#include <blockgate/common/log.hpp>
#include <blockgate/common/util.hpp>

namespace blockgate::node {

namespace beast = boost::beast;
namespace http = boost::beast::http;

HttpTransport::HttpTransport(boost::asio::io_context& io_context, std::shared_ptr<const NodeEndpoint> endpoint)
    : io_context_(io_context),
      endpoint_(std::move(endpoint)),
      url_{parse_url(endpoint_->url)},
      authorization_{make_basic_authorization(endpoint_->user, endpoint_->password)},
      host_header_{make_host_header(url_)} {
    BLOCKGATE_TRACE << "HttpTransport::ctor " << this << " " << *endpoint_ << "\n";
}

HttpTransport::~HttpTransport() {
    BLOCKGATE_TRACE << "HttpTransport::dtor " << this << "\n";
}

boost::asio::awaitable<TransportReply> HttpTransport::post(const std::string& body) {
    const auto start_time = clock_time::now();

    boost::asio::ip::tcp::resolver resolver{io_context_};
    const auto endpoints = co_await resolver.async_resolve(url_.host, url_.port, boost::asio::use_awaitable);

    beast::tcp_stream stream{io_context_};
    co_await stream.async_connect(endpoints, boost::asio::use_awaitable);

    http::request<http::string_body> request{http::verb::post, url_.target, 11};
    request.set(http::field::host, host_header_);
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::content_type, "application/json");
    request.set(http::field::authorization, authorization_);
    request.body() = body;
    request.prepare_payload();
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxNodeResponseSize);
    co_await http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
    auto response = parser.release();

    beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        BLOCKGATE_TRACE << "HttpTransport::post shutdown: " << ec.message() << "\n";
    }

    BLOCKGATE_DEBUG << "HttpTransport::post status=" << response.result_int() << " size=" << response.body().size()
                    << " t=" << clock_time::since(start_time) << "ns\n";
    co_return TransportReply{response.result_int(), std::move(response.body())};
}

} // namespace blockgate::node
