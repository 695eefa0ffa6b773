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

#include "dictionary/reading_dictionary.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace tsuzuri {
namespace dictionary {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(ReadingDictionaryTest, LookupReading) {
  ReadingDictionary dictionary;
  EXPECT_TRUE(dictionary.empty());
  ASSERT_TRUE(dictionary.AddEntry("木", "き").ok());
  ASSERT_TRUE(dictionary.AddEntry("大学生", "だいがくせい").ok());

  EXPECT_EQ(dictionary.size(), 2);
  EXPECT_TRUE(dictionary.HasReading("木"));
  EXPECT_TRUE(dictionary.HasReading("大学生"));
  EXPECT_FALSE(dictionary.HasReading("大学"));

  EXPECT_EQ(dictionary.LookupReading("木"), std::optional<std::string>("き"));
  EXPECT_EQ(dictionary.LookupReading("大学"), std::nullopt);
  EXPECT_EQ(dictionary.max_surface_length(), 3);
}

TEST(ReadingDictionaryTest, RejectEmptyEntries) {
  ReadingDictionary dictionary;
  EXPECT_EQ(dictionary.AddEntry("", "き").code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(dictionary.AddEntry("木", "").code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(dictionary.empty());
}

TEST(ReadingDictionaryTest, AlternateReadings) {
  ReadingDictionary dictionary;
  const std::vector<std::string> alternates = {"こんにち", "きょう", ""};
  ASSERT_TRUE(dictionary.AddEntry("今日", "きょう", alternates).ok());
  EXPECT_THAT(dictionary.GetAlternateReadings("今日"), ElementsAre("こんにち"));
  EXPECT_THAT(dictionary.GetAlternateReadings("明日"), IsEmpty());

  // Alternates are merged, the canonical reading is overwritten.
  const std::vector<std::string> more = {"こんにち", "けふ"};
  ASSERT_TRUE(dictionary.AddEntry("今日", "こんにち", more).ok());
  EXPECT_EQ(dictionary.LookupReading("今日"),
            std::optional<std::string>("こんにち"));
  EXPECT_THAT(dictionary.GetAlternateReadings("今日"), ElementsAre("けふ"));
}

TEST(ReadingDictionaryTest, IsKanji) {
  ReadingDictionary dictionary;
  EXPECT_TRUE(dictionary.IsKanji("木"));
  EXPECT_TRUE(dictionary.IsKanji("々"));
  EXPECT_FALSE(dictionary.IsKanji("き"));
  EXPECT_FALSE(dictionary.IsKanji("。"));
  EXPECT_FALSE(dictionary.IsKanji("木々"));
}

TEST(ReadingDictionaryTest, Clear) {
  ReadingDictionary dictionary;
  ASSERT_TRUE(dictionary.AddEntry("木", "き").ok());
  dictionary.Clear();
  EXPECT_TRUE(dictionary.empty());
  EXPECT_FALSE(dictionary.HasReading("木"));
  EXPECT_EQ(dictionary.max_surface_length(), 0);
}

}  // namespace
}  // namespace dictionary
}  // namespace tsuzuri
