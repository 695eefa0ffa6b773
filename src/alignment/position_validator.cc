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

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "alignment/text_mapping.h"
#include "base/util.h"
#include "composer/sequential_input_validator_interface.h"
#include "dictionary/reading_variation_generator_interface.h"

namespace tsuzuri {
namespace {

// Appends the elements of `chars` not yet in `output`, keeping their order.
void AppendUnique(const std::vector<std::string>& chars,
                  absl::flat_hash_set<std::string>* seen,
                  std::vector<std::string>* output) {
  for (const std::string& ch : chars) {
    if (seen->insert(ch).second) {
      output->push_back(ch);
    }
  }
}

bool Contains(const std::vector<std::string>& chars, absl::string_view ch) {
  return std::find(chars.begin(), chars.end(), ch) != chars.end();
}

}  // namespace

PositionValidator::PositionValidator(
    const dictionary::ReadingVariationGeneratorInterface* alternates,
    const composer::SequentialInputValidatorInterface* sequential)
    : alternates_(alternates), sequential_(sequential) {
  CHECK(sequential_);
}

std::vector<std::string> PositionValidator::CollectPossibleChars(
    const TextMapping& mapping, const CharacterMapping& target) const {
  std::vector<std::string> chars = {target.input_char};

  if (target.is_kanji && target.kanji_word.has_value() &&
      alternates_ != nullptr) {
    // Rank of the kana inside the reading of its own display character, not
    // inside the whole word.
    size_t rank = 0;
    bool found = false;
    for (const CharacterMapping& m : mapping.mappings()) {
      if (m.display_index != target.display_index) {
        continue;
      }
      if (m.input_index == target.input_index) {
        found = true;
        break;
      }
      ++rank;
    }
    if (found) {
      for (const std::string& reading :
           alternates_->GetAlternateReadings(*target.kanji_word)) {
        const std::vector<std::string> reading_chars =
            Util::SplitStringToUtf8Chars(reading);
        if (rank < reading_chars.size()) {
          chars.push_back(reading_chars[rank]);
        }
      }
    }
  }

  chars.insert(chars.end(), target.reading_variations.begin(),
               target.reading_variations.end());

  std::vector<std::string> unique_chars;
  absl::flat_hash_set<std::string> seen;
  AppendUnique(chars, &seen, &unique_chars);
  return unique_chars;
}

ValidationResult PositionValidator::Validate(
    const TextMapping& mapping, absl::string_view user_input,
    size_t input_position, ValidationObserverInterface* observer) const {
  ValidationResult result;
  if (input_position >= mapping.total_input_length() ||
      input_position >= mapping.mappings().size()) {
    if (observer != nullptr) {
      observer->OnValidated(user_input, input_position, result);
    }
    return result;
  }

  const CharacterMapping& target = mapping.mappings()[input_position];
  DCHECK_EQ(target.input_index, input_position);
  const std::vector<std::string> possible_chars =
      CollectPossibleChars(mapping, target);

  const composer::SequentialInputResult sequential =
      sequential_->Check(user_input, target.input_char);
  if (observer != nullptr) {
    observer->OnSequentialCheck(user_input, target.input_char, sequential);
  }

  const bool is_possible = Contains(possible_chars, user_input);
  result.is_valid = is_possible || sequential.is_valid;
  result.is_complete = user_input == target.input_char ||
                       (sequential.is_complete && sequential.is_valid);
  result.can_continue = (is_possible && !result.is_complete) ||
                        (sequential.is_valid && sequential.can_continue);

  absl::flat_hash_set<std::string> seen;
  AppendUnique(possible_chars, &seen, &result.possible_chars);
  AppendUnique(sequential.next_possible_chars, &seen, &result.possible_chars);
  if (sequential.transformation_path.size() > 2) {
    AppendUnique(sequential.transformation_path, &seen,
                 &result.possible_chars);
  }

  if (observer != nullptr) {
    observer->OnValidated(user_input, input_position, result);
  }
  return result;
}

}  // namespace tsuzuri
