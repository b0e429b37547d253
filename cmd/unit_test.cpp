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

#include <cstddef>
#include <string>

#include <gmock/gmock.h>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <blockgate/common/log.hpp>

//! Forwards every failed gMock expectation into the running Catch2 test case.
class GMockFailureReporter : public ::testing::EmptyTestEventListener {
  public:
    void OnTestPartResult(const ::testing::TestPartResult& result) override {
        if (!result.failed()) {
            return;
        }
        const auto* file = result.file_name() ? result.file_name() : "unknown";
        const auto line = result.line_number() > 0 ? static_cast<std::size_t>(result.line_number()) : 0;
        const std::string message = result.message() ? result.message() : "no message";

        const auto disposition = result.fatally_failed()
            ? ::Catch::ResultDisposition::Normal
            : ::Catch::ResultDisposition::ContinueOnFailure;
        ::Catch::AssertionHandler assertion{"GMOCK", ::Catch::SourceLineInfo{file, line}, "", disposition};
        assertion.handleMessage(::Catch::ResultWas::ExplicitFailure, message);
        assertion.setCompleted();
    }
};

int main(int argc, char** argv) {
    ::testing::InitGoogleMock(&argc, argv);

    auto& listeners = ::testing::UnitTest::GetInstance()->listeners();
    delete listeners.Release(listeners.default_result_printer());
    listeners.Append(new GMockFailureReporter);

    BLOCKGATE_LOG_VERBOSITY(blockgate::LogLevel::None);

    return Catch::Session().run(argc, argv);
}
