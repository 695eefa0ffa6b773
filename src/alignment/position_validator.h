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

#ifndef TSUZURI_ALIGNMENT_POSITION_VALIDATOR_H_
#define TSUZURI_ALIGNMENT_POSITION_VALIDATOR_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "alignment/text_mapping.h"
#include "composer/sequential_input_validator_interface.h"
#include "dictionary/reading_variation_generator_interface.h"

namespace tsuzuri {

struct ValidationResult {
  // The input matches an accepted kana or is a legal step toward the target.
  bool is_valid = false;
  // The kana at this position has been entered completely.
  bool is_complete = false;
  // More keystrokes can still complete this position.
  bool can_continue = false;
  // Every kana that satisfies this position or advances toward it, without
  // duplicates.
  std::vector<std::string> possible_chars;

  bool operator==(const ValidationResult& other) const = default;
};

// Receives the intermediate and final results of PositionValidator::Validate.
class ValidationObserverInterface {
 public:
  virtual ~ValidationObserverInterface() = default;

  virtual void OnSequentialCheck(
      absl::string_view user_input, absl::string_view target_char,
      const composer::SequentialInputResult& result) = 0;

  virtual void OnValidated(absl::string_view user_input, size_t input_position,
                           const ValidationResult& result) = 0;

 protected:
  ValidationObserverInterface() = default;
};

// Decides whether the partial user input is acceptable at a position of a
// TextMapping. The validator holds no state of its own; the caller owns the
// cursor and passes it in on every call.
class PositionValidator {
 public:
  // `alternates` may be nullptr, in which case alternate readings of kanji
  // words are not consulted. Both must outlive the validator.
  PositionValidator(
      const dictionary::ReadingVariationGeneratorInterface* alternates,
      const composer::SequentialInputValidatorInterface* sequential);

  PositionValidator(const PositionValidator&) = delete;
  PositionValidator& operator=(const PositionValidator&) = delete;

  // Validates `user_input` against the kana at `input_position`. Returns an
  // all false result when the position is past the mapping. `observer` may be
  // nullptr.
  ValidationResult Validate(const TextMapping& mapping,
                            absl::string_view user_input,
                            size_t input_position,
                            ValidationObserverInterface* observer =
                                nullptr) const;

 private:
  // Collects the target kana, the matching characters of the alternate
  // readings of its word and its attached reading variations.
  std::vector<std::string> CollectPossibleChars(
      const TextMapping& mapping, const CharacterMapping& target) const;

  const dictionary::ReadingVariationGeneratorInterface* alternates_;
  const composer::SequentialInputValidatorInterface* sequential_;
};

}  // namespace tsuzuri

#endif  // TSUZURI_ALIGNMENT_POSITION_VALIDATOR_H_
