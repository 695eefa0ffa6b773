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

#include "alignment/position_validator.h"

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "alignment/alignment_mapper.h"
#include "alignment/text_mapping.h"
#include "alignment/validation_observer.h"
#include "base/vlog.h"
#include "composer/kana_transition_validator.h"
#include "composer/sequential_input_mock.h"
#include "composer/sequential_input_validator_interface.h"
#include "dictionary/reading_dictionary.h"
#include "dictionary/reading_variation_generator.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace tsuzuri {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::IsEmpty;
using ::testing::IsSupersetOf;
using ::testing::Return;
using ::testing::UnorderedElementsAre;

class MockValidationObserver : public ValidationObserverInterface {
 public:
  MOCK_METHOD(void, OnSequentialCheck,
              (absl::string_view user_input, absl::string_view target_char,
               const composer::SequentialInputResult& result),
              (override));
  MOCK_METHOD(void, OnValidated,
              (absl::string_view user_input, size_t input_position,
               const ValidationResult& result),
              (override));
};

class PositionValidatorTest : public ::testing::Test {
 protected:
  PositionValidatorTest()
      : generator_(&dictionary_),
        mapper_(&dictionary_),
        validator_(&generator_, &sequential_) {}

  void SetUp() override {
    AddEntry("木", "き");
    AddEntry("場", "ば");
    AddEntry("方", "かた", {"ほう"});
    AddEntry("角", "かど", {"つの", "すみ"});
    AddEntry("今日", "きょう", {"こんにち"});
  }

  void AddEntry(const std::string& surface, const std::string& reading,
                const std::vector<std::string>& alternates = {}) {
    ASSERT_TRUE(dictionary_.AddEntry(surface, reading, alternates).ok());
  }

  dictionary::ReadingDictionary dictionary_;
  const dictionary::ReadingVariationGenerator generator_;
  const composer::KanaTransitionValidator sequential_;
  const AlignmentMapper mapper_;
  const PositionValidator validator_;
};

TEST_F(PositionValidatorTest, SingleKanjiToEnd) {
  const TextMapping mapping = mapper_.Align("木", "き");

  const ValidationResult result = validator_.Validate(mapping, "き", 0);
  EXPECT_TRUE(result.is_valid);
  EXPECT_TRUE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.possible_chars, ElementsAre("き"));

  // Advancing by one reaches the end of the input.
  EXPECT_EQ(mapping.total_input_length(), 1);
  EXPECT_EQ(validator_.Validate(mapping, "き", 1), ValidationResult());
}

TEST_F(PositionValidatorTest, PastTheEnd) {
  const TextMapping mapping = mapper_.Align("木の", "きの");
  const ValidationResult result = validator_.Validate(mapping, "の", 5);
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.possible_chars, IsEmpty());
}

TEST_F(PositionValidatorTest, TruncatedMapping) {
  // The last input character has no mapping entry.
  const TextMapping mapping = mapper_.Align("木", "きの");
  ASSERT_EQ(mapping.total_input_length(), 2);
  EXPECT_EQ(validator_.Validate(mapping, "の", 1), ValidationResult());
}

TEST_F(PositionValidatorTest, WrongInput) {
  const TextMapping mapping = mapper_.Align("木", "き");
  const ValidationResult result = validator_.Validate(mapping, "け", 0);
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
}

TEST_F(PositionValidatorTest, EmptyInputCanContinue) {
  const TextMapping mapping = mapper_.Align("木", "き");
  const ValidationResult result = validator_.Validate(mapping, "", 0);
  EXPECT_TRUE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_TRUE(result.can_continue);
}

TEST_F(PositionValidatorTest, VoicedTargetFromUnvoicedInput) {
  const TextMapping mapping = mapper_.Align("場", "ば");

  const ValidationResult step = validator_.Validate(mapping, "は", 0);
  EXPECT_TRUE(step.is_valid);
  EXPECT_FALSE(step.is_complete);
  EXPECT_TRUE(step.can_continue);
  EXPECT_THAT(step.possible_chars, ElementsAre("ば"));

  const ValidationResult unrelated = validator_.Validate(mapping, "か", 0);
  EXPECT_FALSE(unrelated.is_valid);
  EXPECT_FALSE(unrelated.can_continue);

  const ValidationResult done = validator_.Validate(mapping, "ば", 0);
  EXPECT_TRUE(done.is_valid);
  EXPECT_TRUE(done.is_complete);
  EXPECT_FALSE(done.can_continue);
}

TEST_F(PositionValidatorTest, SemiVoicedTargetAddsWholeChain) {
  const TextMapping mapping = mapper_.Align("ぱん", "ぱん");
  const ValidationResult result = validator_.Validate(mapping, "は", 0);
  EXPECT_TRUE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_TRUE(result.can_continue);
  EXPECT_THAT(result.possible_chars, UnorderedElementsAre("ぱ", "ば", "は"));
  EXPECT_EQ(result.possible_chars.front(), "ぱ");

  const ValidationResult middle = validator_.Validate(mapping, "ば", 0);
  EXPECT_TRUE(middle.is_valid);
  EXPECT_TRUE(middle.can_continue);
}

TEST_F(PositionValidatorTest, CompletionIsStable) {
  const TextMapping mapping = mapper_.Align("場", "ば");
  const ValidationResult first = validator_.Validate(mapping, "ば", 0);
  ASSERT_TRUE(first.is_complete);
  EXPECT_EQ(validator_.Validate(mapping, "ば", 0), first);
}

TEST_F(PositionValidatorTest, AlternateReadingsOfWord) {
  const TextMapping mapping = mapper_.Align("角", "かど");

  const ValidationResult first = validator_.Validate(mapping, "つ", 0);
  EXPECT_THAT(first.possible_chars, IsSupersetOf({"か", "つ", "す"}));
  EXPECT_TRUE(first.is_valid);
  EXPECT_FALSE(first.is_complete);
  EXPECT_TRUE(first.can_continue);

  const ValidationResult second = validator_.Validate(mapping, "の", 1);
  EXPECT_THAT(second.possible_chars, ElementsAre("ど", "の", "み"));
  EXPECT_TRUE(second.is_valid);
}

TEST_F(PositionValidatorTest, AlternatesAndVariationsAreDeduplicated) {
  const TextMapping mapping =
      mapper_.AlignWithVariants("角", "かど", generator_);
  ASSERT_THAT(mapping.mappings()[1].reading_variations,
              UnorderedElementsAre("の", "み"));

  const ValidationResult result = validator_.Validate(mapping, "の", 1);
  EXPECT_THAT(result.possible_chars, ElementsAre("ど", "の", "み"));
}

TEST_F(PositionValidatorTest, VariationsStayOnTheirOwnWord) {
  AddEntry("肩", "かた");
  // 方 is typed with its alternate reading ほう.
  const TextMapping mapping =
      mapper_.AlignWithVariants("方の肩", "ほうのかた", generator_);
  ASSERT_EQ(mapping.mappings().size(), 5);
  EXPECT_THAT(mapping.mappings()[0].reading_variations, ElementsAre("か"));
  EXPECT_THAT(mapping.mappings()[3].reading_variations, ElementsAre("か"));

  // The canonical reading of 方 is accepted for 方.
  EXPECT_TRUE(validator_.Validate(mapping, "か", 0).is_valid);

  // ほ is not a reading of 肩.
  const ValidationResult result = validator_.Validate(mapping, "ほ", 3);
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.possible_chars, ElementsAre("か"));
}

TEST_F(PositionValidatorTest, AlternateRankInsideOwnKanji) {
  // 今 and 日 have no reading of their own: 今 gets き and 日 gets ょう.
  const TextMapping mapping = mapper_.Align("今日", "きょう");
  ASSERT_EQ(mapping.mappings()[2].display_index, 1);

  // う is the second kana of 日, so the second character of こんにち applies.
  const ValidationResult result = validator_.Validate(mapping, "ん", 2);
  EXPECT_THAT(result.possible_chars, ElementsAre("う", "ん"));
  EXPECT_TRUE(result.is_valid);
}

TEST_F(PositionValidatorTest, WithoutAlternateSource) {
  const PositionValidator validator(nullptr, &sequential_);
  const TextMapping mapping = mapper_.Align("角", "かど");
  const ValidationResult result = validator.Validate(mapping, "の", 1);
  EXPECT_FALSE(result.is_valid);
  EXPECT_THAT(result.possible_chars, ElementsAre("ど"));
}

TEST_F(PositionValidatorTest, SequentialResultIsCombined) {
  composer::MockSequentialInputValidator sequential;
  const PositionValidator validator(nullptr, &sequential);
  const TextMapping mapping = mapper_.Align("木", "き");

  composer::SequentialInputResult complete;
  complete.is_valid = true;
  complete.is_complete = true;
  complete.next_possible_chars = {"ぎ"};
  EXPECT_CALL(sequential, Check("x", "き")).WillOnce(Return(complete));

  const ValidationResult result = validator.Validate(mapping, "x", 0);
  EXPECT_TRUE(result.is_valid);
  EXPECT_TRUE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
  EXPECT_THAT(result.possible_chars, ElementsAre("き", "ぎ"));
}

TEST_F(PositionValidatorTest, CompleteButInvalidSequentialIsIgnored) {
  composer::MockSequentialInputValidator sequential;
  const PositionValidator validator(nullptr, &sequential);
  const TextMapping mapping = mapper_.Align("木", "き");

  composer::SequentialInputResult inconsistent;
  inconsistent.is_complete = true;
  inconsistent.can_continue = true;
  EXPECT_CALL(sequential, Check(_, _)).WillOnce(Return(inconsistent));

  const ValidationResult result = validator.Validate(mapping, "x", 0);
  EXPECT_FALSE(result.is_valid);
  EXPECT_FALSE(result.is_complete);
  EXPECT_FALSE(result.can_continue);
}

TEST_F(PositionValidatorTest, ObserverIsNotified) {
  const TextMapping mapping = mapper_.Align("場", "ば");
  MockValidationObserver observer;
  {
    InSequence seq;
    EXPECT_CALL(observer,
                OnSequentialCheck("は", "ば",
                                  Field(&composer::SequentialInputResult::
                                            can_continue,
                                        true)));
    EXPECT_CALL(observer,
                OnValidated("は", 0,
                            Field(&ValidationResult::is_valid, true)));
  }
  validator_.Validate(mapping, "は", 0, &observer);
}

TEST_F(PositionValidatorTest, ObserverSeesTerminalState) {
  const TextMapping mapping = mapper_.Align("場", "ば");
  MockValidationObserver observer;
  EXPECT_CALL(observer, OnSequentialCheck(_, _, _)).Times(0);
  EXPECT_CALL(observer, OnValidated("ば", 1, ValidationResult()));
  validator_.Validate(mapping, "ば", 1, &observer);
}

TEST_F(PositionValidatorTest, LoggingObserver) {
  const ScopedVerboseLevel verbose(2);
  const TextMapping mapping = mapper_.Align("場", "ば");
  LoggingValidationObserver observer;
  EXPECT_TRUE(validator_.Validate(mapping, "は", 0, &observer).can_continue);
}

}  // namespace
}  // namespace tsuzuri
