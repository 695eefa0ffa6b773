// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "base/log_file.h"

#include <fstream>
#include <sstream>
#include <string>

#include "absl/base/log_severity.h"
#include "absl/log/log.h"
#include "absl/log/log_sink_registry.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace tsuzuri {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

std::string ReadFile(const std::string& path) {
  std::ifstream ifs(path);
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  return buffer.str();
}

TEST(LogFileTest, AppendsLogLines) {
  const std::string path = ::testing::TempDir() + "/log_file_test.log";
  ASSERT_TRUE(
      RegisterLogFileSink(path, absl::LogSeverityAtLeast::kWarning).ok());

  LOG(INFO) << "below threshold";
  LOG(WARNING) << "written to file";
  absl::FlushLogSinks();

  const std::string content = ReadFile(path);
  EXPECT_THAT(content, HasSubstr("written to file"));
  EXPECT_THAT(content, Not(HasSubstr("below threshold")));
}

TEST(LogFileTest, UnwritablePath) {
  EXPECT_FALSE(
      RegisterLogFileSink(::testing::TempDir() + "/no/such/dir/test.log")
          .ok());
}

}  // namespace
}  // namespace tsuzuri
