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

#include "log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include <absl/strings/str_cat.h>

namespace blockgate {

LogLevel log_verbosity_{LogLevel::Info};
bool log_thread_enabled_{false};

std::mutex log_::log_mtx_;

namespace {

class null_buffer : public std::streambuf {
  public:
    int overflow(int c) override { return c; }
};

null_buffer null_buffer_;
std::ostream null_stream_{&null_buffer_};

// first stream gets everything below Warn, second one the rest
std::ostream* log_streams_[2] = {&std::cout, &std::cerr};

const char* kLogTags[] = {
    "TRACE",
    "DEBUG",
    " INFO",
    " WARN",
    "ERROR",
    " CRIT",
    "  LOG",
};

} // namespace

std::ostream& null_stream() {
    return null_stream_;
}

void log_set_streams_(std::ostream& o1, std::ostream& o2) {
    log_streams_[0] = &o1;
    log_streams_[1] = &o2;
}

std::ostream& log_::header_(LogLevel level) {
    const bool is_error = level >= LogLevel::Warn && level != LogLevel::None;
    std::ostream& out = *log_streams_[is_error ? 1 : 0];

    const auto now = std::chrono::system_clock::now();
    const auto now_time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm now_tm{};
    ::gmtime_r(&now_time, &now_tm);

    out << kLogTags[static_cast<int>(level)] << " [" << std::put_time(&now_tm, "%m-%d|%H:%M:%S") << "."
        << std::setw(3) << std::setfill('0') << millis << std::setfill(' ') << "]";
    if (log_thread_enabled_) {
        out << " [" << std::this_thread::get_id() << "]";
    }
    return out;
}

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error) {
    if (text == "n") {
        *level = LogLevel::None;
        return true;
    }
    if (text == "c") {
        *level = LogLevel::Critical;
        return true;
    }
    if (text == "e") {
        *level = LogLevel::Error;
        return true;
    }
    if (text == "w") {
        *level = LogLevel::Warn;
        return true;
    }
    if (text == "i") {
        *level = LogLevel::Info;
        return true;
    }
    if (text == "d") {
        *level = LogLevel::Debug;
        return true;
    }
    if (text == "t") {
        *level = LogLevel::Trace;
        return true;
    }
    *error = "unknown value for LogLevel";
    return false;
}

std::string AbslUnparseFlag(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "n";
        case LogLevel::Critical: return "c";
        case LogLevel::Error: return "e";
        case LogLevel::Warn: return "w";
        case LogLevel::Info: return "i";
        case LogLevel::Debug: return "d";
        case LogLevel::Trace: return "t";
        default: return absl::StrCat(static_cast<int>(level));
    }
}

} // namespace blockgate
