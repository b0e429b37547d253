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

#ifndef BLOCKGATE_COMMON_LOG_HPP_
#define BLOCKGATE_COMMON_LOG_HPP_

#include <absl/strings/string_view.h>

#include <mutex>
#include <ostream>
#include <string>

namespace blockgate {

// available verbosity levels
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, None };

// silence
std::ostream& null_stream();

//
// Below are for access via macros ONLY.
//
extern LogLevel log_verbosity_;
extern bool log_thread_enabled_;
void log_set_streams_(std::ostream& o1, std::ostream& o2);
class log_ {
  public:
    explicit log_(LogLevel level) : level_(level) { log_mtx_.lock(); }
    ~log_() { log_mtx_.unlock(); }
    std::ostream& header_(LogLevel);
    template <class T>
    std::ostream& operator<<(const T& message) {
        return header_(level_) << message;
    }

  private:
    LogLevel level_;
    static std::mutex log_mtx_;
};

using Logger = log_;

#define BLOCKGATE_LOG_AT(level_) if ((level_) < blockgate::log_verbosity_) {} else blockgate::log_(level_) << " " // NOLINT

#define BLOCKGATE_TRACE BLOCKGATE_LOG_AT(blockgate::LogLevel::Trace)
#define BLOCKGATE_DEBUG BLOCKGATE_LOG_AT(blockgate::LogLevel::Debug)
#define BLOCKGATE_INFO  BLOCKGATE_LOG_AT(blockgate::LogLevel::Info)
#define BLOCKGATE_WARN  BLOCKGATE_LOG_AT(blockgate::LogLevel::Warn)
#define BLOCKGATE_ERROR BLOCKGATE_LOG_AT(blockgate::LogLevel::Error)
#define BLOCKGATE_CRIT  BLOCKGATE_LOG_AT(blockgate::LogLevel::Critical)
#define BLOCKGATE_LOG   BLOCKGATE_LOG_AT(blockgate::LogLevel::None)

#define BLOCKGATE_LOG_VERBOSITY(level_) (blockgate::log_verbosity_ = (level_))

#define BLOCKGATE_LOG_THREAD(log_thread_) (blockgate::log_thread_enabled_ = (log_thread_))

#define BLOCKGATE_LOG_STREAMS(stream1_, stream2_) blockgate::log_set_streams_((stream1_), (stream2_))

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error);
std::string AbslUnparseFlag(LogLevel level);

} // namespace blockgate

#endif  // BLOCKGATE_COMMON_LOG_HPP_
