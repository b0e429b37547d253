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

#include "request_parser.hpp"

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include <blockgate/common/constants.hpp>
#include <blockgate/common/log.hpp>

namespace blockgate::http {

RequestParser::RequestParser() : state_(method_start), header_size_(0) {}

void RequestParser::reset() {
    state_ = method_start;
    header_size_ = 0;
}

RequestParser::ResultType RequestParser::consume(Request& req, char input) {
    if (state_ != content && ++header_size_ > kMaxRequestHeaderSize) {
        BLOCKGATE_DEBUG << "RequestParser::consume request line and headers exceed " << kMaxRequestHeaderSize << " bytes\n";
        return bad;
    }
    switch (state_) {
        case method_start:
            if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                return bad;
            } else {
                state_ = method;
                req.method.reserve(kRequestMethodInitialCapacity);
                req.method.push_back(input);
                return indeterminate;
            }
        case method:
            if (input == ' ') {
                state_ = uri;
                req.uri.reserve(kRequestUriInitialCapacity);
                return indeterminate;
            } else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                return bad;
            } else {
                req.method.push_back(input);
                return indeterminate;
            }
        case uri:
            if (input == ' ') {
                if (req.uri.empty()) {
                    return bad;
                }
                state_ = http_version_h;
                return indeterminate;
            } else if (is_ctl(input)) {
                return bad;
            } else {
                req.uri.push_back(input);
                return indeterminate;
            }
        case http_version_h:
            if (input == 'H') {
                state_ = http_version_t_1;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_t_1:
            if (input == 'T') {
                state_ = http_version_t_2;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_t_2:
            if (input == 'T') {
                state_ = http_version_p;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_p:
            if (input == 'P') {
                state_ = http_version_slash;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_slash:
            if (input == '/') {
                req.http_version_major = 0;
                req.http_version_minor = 0;
                state_ = http_version_major_start;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_major_start:
            if (is_digit(input)) {
                req.http_version_major = input - '0';
                state_ = http_version_major;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_major:
            if (input == '.') {
                state_ = http_version_minor_start;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_minor_start:
            if (is_digit(input)) {
                req.http_version_minor = input - '0';
                state_ = http_version_minor;
                return indeterminate;
            } else {
                return bad;
            }
        case http_version_minor:
            if (input == '\r') {
                state_ = expecting_newline_1;
                return indeterminate;
            } else {
                return bad;
            }
        case expecting_newline_1:
            if (input == '\n') {
                state_ = header_line_start;
                req.headers.reserve(kRequestHeadersInitialCapacity);
                return indeterminate;
            } else {
                return bad;
            }
        case header_line_start:
            if (input == '\r') {
                state_ = expecting_newline_3;
                return indeterminate;
            } else if (!req.headers.empty() && (input == ' ' || input == '\t')) {
                state_ = header_lws;
                return indeterminate;
            } else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                return bad;
            } else {
                req.headers.push_back(Header());
                req.headers.back().name.push_back(input);
                state_ = header_name;
                return indeterminate;
            }
        case header_lws:
            if (input == '\r') {
                state_ = expecting_newline_2;
                return indeterminate;
            } else if (input == ' ' || input == '\t') {
                return indeterminate;
            } else if (is_ctl(input)) {
                return bad;
            } else {
                state_ = header_value;
                req.headers.back().value.push_back(input);
                return indeterminate;
            }
        case header_name:
            if (input == ':') {
                state_ = space_before_header_value;
                return indeterminate;
            } else if (!is_char(input) || is_ctl(input) || is_tspecial(input)) {
                return bad;
            } else {
                req.headers.back().name.push_back(input);
                return indeterminate;
            }
        case space_before_header_value:
            if (input == ' ') {
                state_ = header_value;
                return indeterminate;
            } else {
                return bad;
            }
        case header_value:
            if (input == '\r') {
                state_ = expecting_newline_2;
                return indeterminate;
            } else if (is_ctl(input)) {
                return bad;
            } else {
                req.headers.back().value.push_back(input);
                return indeterminate;
            }
        case expecting_newline_2:
            if (input == '\n') {
                state_ = header_line_start;
                return indeterminate;
            } else {
                return bad;
            }
        case expecting_newline_3:
            if (input == '\n') {
                return end_of_headers(req);
            } else {
                return bad;
            }
        case content:
            req.content.push_back(input);
            if (req.content.size() < req.content_length) {
                return indeterminate;
            }
            return good;
        default:
            return bad;
    }
}

RequestParser::ResultType RequestParser::end_of_headers(Request& req) {
    for (const auto& h : req.headers) {
        if (absl::EqualsIgnoreCase(h.name, "Transfer-Encoding")) {
            BLOCKGATE_DEBUG << "RequestParser::end_of_headers chunked body not supported\n";
            return bad;
        }
        if (absl::EqualsIgnoreCase(h.name, "Content-Length")) {
            if (!absl::SimpleAtoi(h.value, &req.content_length) || req.content_length > kMaxRequestContentSize) {
                BLOCKGATE_DEBUG << "RequestParser::end_of_headers invalid Content-Length: " << h.value << "\n";
                return bad;
            }
        }
    }
    if (req.content_length == 0) {
        return good;
    }
    req.content.reserve(req.content_length);
    state_ = content;
    return indeterminate;
}

bool RequestParser::is_char(int c) {
    return c >= 0 && c <= 127;
}

bool RequestParser::is_ctl(int c) {
    return (c >= 0 && c <= 31) || (c == 127);
}

bool RequestParser::is_tspecial(int c) {
    switch (c) {
        case '(': case ')': case '<': case '>': case '@':
        case ',': case ';': case ':': case '\\': case '"':
        case '/': case '[': case ']': case '?': case '=':
        case '{': case '}': case ' ': case '\t':
            return true;
        default:
            return false;
    }
}

bool RequestParser::is_digit(int c) {
    return c >= '0' && c <= '9';
}

} // namespace blockgate::http
