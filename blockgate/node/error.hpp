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

#ifndef BLOCKGATE_NODE_ERROR_HPP_
#define BLOCKGATE_NODE_ERROR_HPP_

#include <string>
#include <system_error>
#include <utility>

namespace blockgate::node {

//! The failures of a JSON-RPC call to the node
enum class NodeErrc {
    // value 0 reserved for no error
    connection_failed = 100,
    http_status,
    malformed_response,
    rpc_failure,
};

std::error_code make_error_code(NodeErrc errc);

//! Exception raised by the node client: the error code tells the cause, detail() keeps the diagnostic payload
class NodeError : public std::system_error {
  public:
    NodeError(NodeErrc errc, const std::string& message, std::string detail = {}, unsigned int http_status = 0)
        : std::system_error{make_error_code(errc), message}, detail_{std::move(detail)}, http_status_{http_status} {}

    NodeErrc errc() const noexcept { return static_cast<NodeErrc>(code().value()); }

    //! The raw response body or the transport error text, for logging only
    const std::string& detail() const noexcept { return detail_; }

    //! The HTTP status returned by the node, zero if none was received
    unsigned int http_status() const noexcept { return http_status_; }

  private:
    std::string detail_;
    unsigned int http_status_;
};

} // namespace blockgate::node

namespace std {

template<>
struct is_error_code_enum<blockgate::node::NodeErrc> : true_type {};

} // namespace std

#endif  // BLOCKGATE_NODE_ERROR_HPP_
