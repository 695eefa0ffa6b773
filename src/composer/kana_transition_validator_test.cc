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

#include "composer/kana_transition_validator.h"

#include "composer/sequential_input_validator_interface.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace tsuzuri {
namespace composer {
namespace {

using ::testing::DoubleEq;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(KanaTransitionValidatorTest, ExactMatchIsComplete) {
  const KanaTransitionValidator validator;
  const SequentialInputResult result = validator.Check("き", "き");
  EXPECT_TRUE(result.is_valid);
  EXPECT_TRUE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.confidence, DoubleEq(1.0));
  EXPECT_THAT(result.next_possible_chars, IsEmpty());
  EXPECT_THAT(result.transformation_path, ElementsAre("き"));
}

TEST(KanaTransitionValidatorTest, UnvoicedToVoiced) {
  const KanaTransitionValidator validator;
  const SequentialInputResult result = validator.Check("か", "が");
  EXPECT_TRUE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_TRUE(result.can_continue);
  EXPECT_THAT(result.confidence, DoubleEq(0.5));
  EXPECT_THAT(result.next_possible_chars, ElementsAre("が"));
  EXPECT_THAT(result.transformation_path, ElementsAre("か", "が"));
  EXPECT_EQ(result.hint, "か→が");
}

TEST(KanaTransitionValidatorTest, ThreeStageTransformation) {
  const KanaTransitionValidator validator;
  {
    const SequentialInputResult result = validator.Check("は", "ぱ");
    EXPECT_TRUE(result.is_valid);
    EXPECT_FALSE(result.is_complete);
    EXPECT_TRUE(result.can_continue);
    EXPECT_THAT(result.next_possible_chars, ElementsAre("ば", "ぱ"));
    EXPECT_THAT(result.transformation_path, ElementsAre("は", "ば", "ぱ"));
    EXPECT_EQ(result.hint, "は→ば→ぱ");
  }
  {
    const SequentialInputResult result = validator.Check("ば", "ぱ");
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.can_continue);
    EXPECT_THAT(result.next_possible_chars, ElementsAre("ぱ"));
  }
  {
    const SequentialInputResult result = validator.Check("ぱ", "ぱ");
    EXPECT_TRUE(result.is_complete);
    EXPECT_THAT(result.transformation_path, ElementsAre("は", "ば", "ぱ"));
  }
}

TEST(KanaTransitionValidatorTest, StepsPastTheTargetAreInvalid) {
  const KanaTransitionValidator validator;
  // ぱ is after ば on the chain, it can't become ば anymore.
  const SequentialInputResult result = validator.Check("ぱ", "ば");
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.confidence, DoubleEq(0.0));
}

TEST(KanaTransitionValidatorTest, UnrelatedInputIsInvalid) {
  const KanaTransitionValidator validator;
  for (const char* input : {"さ", "ば", "x", "はは", "漢"}) {
    const SequentialInputResult result = validator.Check(input, "が");
    EXPECT_FALSE(result.is_valid) << input;
    EXPECT_FALSE(result.can_continue) << input;
    EXPECT_FALSE(result.is_complete) << input;
  }
}

TEST(KanaTransitionValidatorTest, SmallKana) {
  const KanaTransitionValidator validator;
  EXPECT_TRUE(validator.Check("つ", "っ").can_continue);
  EXPECT_TRUE(validator.Check("つ", "づ").can_continue);
  EXPECT_TRUE(validator.Check("っ", "づ").can_continue);
  EXPECT_TRUE(validator.Check("や", "ゃ").can_continue);
  EXPECT_TRUE(validator.Check("う", "ゔ").can_continue);
  EXPECT_FALSE(validator.Check("ゃ", "や").is_valid);
}

TEST(KanaTransitionValidatorTest, Katakana) {
  const KanaTransitionValidator validator;
  const SequentialInputResult result = validator.Check("ハ", "パ");
  EXPECT_TRUE(result.is_valid);
  EXPECT_TRUE(result.can_continue);
  EXPECT_THAT(result.transformation_path, ElementsAre("ハ", "バ", "パ"));
  EXPECT_TRUE(validator.Check("ウ", "ヴ").can_continue);
  // Hiragana never becomes katakana.
  EXPECT_FALSE(validator.Check("は", "パ").is_valid);
}

TEST(KanaTransitionValidatorTest, EmptyInputCanContinue) {
  const KanaTransitionValidator validator;
  const SequentialInputResult result = validator.Check("", "ぱ");
  EXPECT_TRUE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_TRUE(result.can_continue);
  EXPECT_THAT(result.confidence, DoubleEq(0.0));
  EXPECT_THAT(result.next_possible_chars, ElementsAre("は", "ば", "ぱ"));
}

TEST(KanaTransitionValidatorTest, TargetWithoutModifierForms) {
  const KanaTransitionValidator validator;
  EXPECT_TRUE(validator.Check("ん", "ん").is_complete);
  EXPECT_FALSE(validator.Check("な", "ん").is_valid);
  EXPECT_THAT(validator.Check("", "ん").transformation_path, ElementsAre("ん"));
}

TEST(KanaTransitionValidatorTest, EmptyTarget) {
  const KanaTransitionValidator validator;
  const SequentialInputResult result = validator.Check("", "");
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.transformation_path, IsEmpty());
}

TEST(KanaTransitionValidatorTest, KatakanaSmallAndVoicedChain) {
  const KanaTransitionValidator validator;
  const SequentialInputResult result = validator.Check("ツ", "ヅ");
  EXPECT_TRUE(result.is_valid);
  EXPECT_TRUE(result.can_continue);
  EXPECT_THAT(result.next_possible_chars, ElementsAre("ッ", "ヅ"));
  EXPECT_THAT(result.transformation_path, ElementsAre("ツ", "ッ", "ヅ"));
}

}  // namespace
}  // namespace composer
}  // namespace tsuzuri
