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

#include "base/vlog.h"

#include "absl/flags/declare.h"
#include "absl/flags/flag.h"
#include "absl/log/flags.h"  // IWYU pragma: keep
#include "testing/gunit.h"

ABSL_DECLARE_FLAG(int, v);

namespace tsuzuri {
namespace {

class VLogTest : public ::testing::Test {
 protected:
  void TearDown() override {
    absl::SetFlag(&FLAGS_v, 0);
    internal::SetEngineVerboseLevel(0);
  }
};

TEST_F(VLogTest, MaxOfFlagAndConfig) {
  absl::SetFlag(&FLAGS_v, 0);
  internal::SetEngineVerboseLevel(0);
  EXPECT_EQ(internal::GetVLogLevel(), 0);
  EXPECT_FALSE(TSUZURI_VLOG_IS_ON(1));

  internal::SetEngineVerboseLevel(2);
  EXPECT_EQ(internal::GetVLogLevel(), 2);
  EXPECT_TRUE(TSUZURI_VLOG_IS_ON(2));
  EXPECT_FALSE(TSUZURI_VLOG_IS_ON(3));

  absl::SetFlag(&FLAGS_v, 3);
  EXPECT_EQ(internal::GetVLogLevel(), 3);
}

TEST_F(VLogTest, NegativeEngineLevelIsClamped) {
  absl::SetFlag(&FLAGS_v, 0);
  internal::SetEngineVerboseLevel(-3);
  EXPECT_EQ(internal::GetEngineVerboseLevel(), 0);
  EXPECT_EQ(internal::GetVLogLevel(), 0);
}

TEST_F(VLogTest, ScopedVerboseLevel) {
  absl::SetFlag(&FLAGS_v, 0);
  internal::SetEngineVerboseLevel(1);
  {
    ScopedVerboseLevel verbose(3);
    EXPECT_TRUE(TSUZURI_VLOG_IS_ON(3));
    {
      ScopedVerboseLevel quiet(0);
      EXPECT_FALSE(TSUZURI_VLOG_IS_ON(1));
    }
    EXPECT_EQ(internal::GetEngineVerboseLevel(), 3);
  }
  EXPECT_EQ(internal::GetEngineVerboseLevel(), 1);
}

}  // namespace
}  // namespace tsuzuri
