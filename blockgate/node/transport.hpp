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

#ifndef BLOCKGATE_NODE_TRANSPORT_HPP_
#define BLOCKGATE_NODE_TRANSPORT_HPP_

#include <string>

#include <blockgate/config.hpp>

#include <boost/asio/awaitable.hpp>

namespace blockgate::node {

struct TransportReply {
    unsigned int status{0};
    std::string body;
};

//! The carrier of JSON-RPC requests toward the node.
class Transport {
  public:
    virtual ~Transport() = default;

    //! Send \p body in one single attempt and return whatever the node answers, throwing boost::system::system_error
    //! if no HTTP reply is received
    virtual boost::asio::awaitable<TransportReply> post(const std::string& body) = 0;
};

} // namespace blockgate::node

#endif  // BLOCKGATE_NODE_TRANSPORT_HPP_
