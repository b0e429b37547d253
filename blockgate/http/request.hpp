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

#ifndef BLOCKGATE_HTTP_REQUEST_HPP_
#define BLOCKGATE_HTTP_REQUEST_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/match.h>

#include <blockgate/http/header.hpp>

namespace blockgate::http {

/// A request received from a client.
struct Request {
    std::string method;
    std::string uri;
    int http_version_major{0};
    int http_version_minor{0};
    std::vector<Header> headers;
    std::size_t content_length{0};
    std::string content;

    /// Value of the first header named \p name, compared case-insensitively.
    std::optional<std::string> header(const std::string& name) const {
        for (const auto& h : headers) {
            if (absl::EqualsIgnoreCase(h.name, name)) {
                return h.value;
            }
        }
        return std::nullopt;
    }

    /// Whether the client asks to keep the connection open after the reply.
    bool keep_alive() const {
        const auto connection = header("Connection");
        if (http_version_major == 1 && http_version_minor == 0) {
            return connection && absl::EqualsIgnoreCase(*connection, "keep-alive");
        }
        return !connection || !absl::EqualsIgnoreCase(*connection, "close");
    }

    void reset() {
        method.clear();
        uri.clear();
        http_version_major = 0;
        http_version_minor = 0;
        headers.clear();
        content_length = 0;
        content.clear();
    }
};

} // namespace blockgate::http

#endif // BLOCKGATE_HTTP_REQUEST_HPP_
