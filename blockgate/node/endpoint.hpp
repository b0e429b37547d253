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

#ifndef BLOCKGATE_NODE_ENDPOINT_HPP_
#define BLOCKGATE_NODE_ENDPOINT_HPP_

#include <iostream>
#include <string>

namespace blockgate::node {

//! Location and credentials of the JSON-RPC node. Loaded once at startup, never mutated afterwards.
struct NodeEndpoint {
    std::string url;
    std::string user;
    std::string password;
};

std::ostream& operator<<(std::ostream& out, const NodeEndpoint& endpoint);

//! The components of a plain HTTP URL: http://<host>[:<port>][<target>]
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

bool operator==(const Url& lhs, const Url& rhs);

//! Split \p url into its components, throwing std::invalid_argument if unsupported or malformed
Url parse_url(const std::string& url);

//! Value of the Host header for \p url: IPv6 hosts in brackets, default port omitted
std::string make_host_header(const Url& url);

} // namespace blockgate::node

#endif  // BLOCKGATE_NODE_ENDPOINT_HPP_
