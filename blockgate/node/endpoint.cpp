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

#include "endpoint.hpp"

#include <cstdint>
#include <cstring>
#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include <blockgate/common/constants.hpp>

namespace blockgate::node {

std::ostream& operator<<(std::ostream& out, const NodeEndpoint& endpoint) {
    // credentials are never printed
    out << "url: " << endpoint.url << " user: " << endpoint.user;
    return out;
}

bool operator==(const Url& lhs, const Url& rhs) {
    return lhs.scheme == rhs.scheme && lhs.host == rhs.host && lhs.port == rhs.port && lhs.target == rhs.target;
}

static std::string parse_port(const std::string& port, const std::string& url) {
    uint32_t port_number{0};
    if (!absl::SimpleAtoi(port, &port_number) || port_number == 0 || port_number > 65535) {
        throw std::invalid_argument{"invalid port in URL: " + url};
    }
    return port;
}

Url parse_url(const std::string& url) {
    const auto scheme_end = url.find(kSchemeSeparator);
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument{"missing scheme in URL: " + url};
    }
    Url parsed;
    parsed.scheme = absl::AsciiStrToLower(url.substr(0, scheme_end));
    if (parsed.scheme != kHttpScheme) {
        throw std::invalid_argument{"unsupported scheme in URL: " + url};
    }

    const auto authority_start = scheme_end + std::strlen(kSchemeSeparator);
    const auto target_start = url.find(kPathSeparator, authority_start);
    const auto authority = url.substr(authority_start, target_start - authority_start);
    parsed.target = target_start == std::string::npos ? kPathSeparator : url.substr(target_start);

    // The URL itself is not echoed: it may contain a password
    if (authority.find('@') != std::string::npos) {
        throw std::invalid_argument{"credentials in node URL are not supported, use rpc.user and rpc.pass"};
    }

    parsed.port = kDefaultHttpPort;
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal: http://[::1]:8332
        const auto literal_end = authority.find(']');
        if (literal_end == std::string::npos) {
            throw std::invalid_argument{"unterminated IPv6 address in URL: " + url};
        }
        parsed.host = authority.substr(1, literal_end - 1);
        const auto rest = authority.substr(literal_end + 1);
        if (!rest.empty()) {
            if (!absl::StartsWith(rest, kAddressPortSeparator)) {
                throw std::invalid_argument{"invalid characters after IPv6 address in URL: " + url};
            }
            parsed.port = parse_port(rest.substr(std::strlen(kAddressPortSeparator)), url);
        }
    } else {
        const auto port_start = authority.find(kAddressPortSeparator);
        parsed.host = authority.substr(0, port_start);
        if (port_start != std::string::npos) {
            parsed.port = parse_port(authority.substr(port_start + std::strlen(kAddressPortSeparator)), url);
        }
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument{"missing host in URL: " + url};
    }
    return parsed;
}

std::string make_host_header(const Url& url) {
    const auto host = url.host.find(':') == std::string::npos ? url.host : "[" + url.host + "]";
    if (url.port == kDefaultHttpPort) {
        return host;
    }
    return host + kAddressPortSeparator + url.port;
}

} // namespace blockgate::node
