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

#ifndef BLOCKGATE_COMMON_UTIL_HPP_
#define BLOCKGATE_COMMON_UTIL_HPP_

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/buffer.hpp>

namespace blockgate {

std::string base64_encode(const uint8_t* bytes_to_encode, std::size_t len, bool url);

inline std::string base64_encode(std::string_view text, bool url = false) {
    return base64_encode(reinterpret_cast<const uint8_t*>(text.data()), text.size(), url);
}

//! Value of the HTTP Authorization header for Basic scheme (RFC 7617).
std::string make_basic_authorization(const std::string& user, const std::string& password);

} // namespace blockgate

inline std::ostream& operator<<(std::ostream& out, const boost::asio::const_buffer& buffer) {
    out << std::string{static_cast<const char*>(buffer.data()), buffer.size()};
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const std::vector<boost::asio::const_buffer>& buffers) {
    for (const auto& buffer : buffers) {
        out << buffer;
    }
    return out;
}

#endif // BLOCKGATE_COMMON_UTIL_HPP_
