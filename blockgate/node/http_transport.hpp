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

#ifndef BLOCKGATE_NODE_HTTP_TRANSPORT_HPP_
#define BLOCKGATE_NODE_HTTP_TRANSPORT_HPP_

#include <memory>
#include <string>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <blockgate/node/endpoint.hpp>
#include <blockgate/node/transport.hpp>

namespace blockgate::node {

//! HTTP/1.1 POST with Basic authentication toward the node, one fresh connection per request.
class HttpTransport : public Transport {
  public:
    explicit HttpTransport(boost::asio::io_context& io_context, std::shared_ptr<const NodeEndpoint> endpoint);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    boost::asio::awaitable<TransportReply> post(const std::string& body) override;

  private:
    boost::asio::io_context& io_context_;
    std::shared_ptr<const NodeEndpoint> endpoint_;
    const Url url_;
    const std::string authorization_;
    const std::string host_header_;
};

} // namespace blockgate::node

#endif  // BLOCKGATE_NODE_HTTP_TRANSPORT_HPP_
