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

#include "dictionary/reading_variation_generator.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "base/util.h"
#include "base/vlog.h"
#include "dictionary/reading_dictionary.h"

namespace tsuzuri {
namespace dictionary {

namespace {

// Returns true if the characters of `reading` appear in `input_chars` starting
// exactly at `pos`.
bool ReadingStartsAt(const std::vector<std::string>& input_chars, size_t pos,
                     absl::string_view reading) {
  const std::vector<std::string> reading_chars =
      Util::SplitStringToUtf8Chars(reading);
  return reading_chars.size() <= input_chars.size() - pos &&
         std::equal(reading_chars.begin(), reading_chars.end(),
                    input_chars.begin() + pos);
}

}  // namespace

ReadingVariationGenerator::ReadingVariationGenerator(
    const ReadingDictionary* dictionary)
    : dictionary_(dictionary) {
  CHECK(dictionary_);
}

std::vector<std::string> ReadingVariationGenerator::GenerateVariants(
    const absl::string_view display_text,
    const absl::string_view base_input_text) const {
  const std::vector<std::string> display_chars =
      Util::SplitStringToUtf8Chars(display_text);
  const std::vector<std::string> input_chars =
      Util::SplitStringToUtf8Chars(base_input_text);

  std::vector<std::string> variants;
  absl::flat_hash_set<std::string> seen = {std::string(base_input_text)};

  size_t display_pos = 0;
  size_t input_pos = 0;
  while (display_pos < display_chars.size() &&
         input_pos < input_chars.size()) {
    const size_t max_length = std::min(dictionary_->max_surface_length(),
                                       display_chars.size() - display_pos);
    size_t word_length = 0;
    size_t reading_length = 0;
    for (size_t len = max_length; len >= 1; --len) {
      const std::string word = absl::StrJoin(
          display_chars.begin() + display_pos,
          display_chars.begin() + display_pos + len, "");
      const ReadingDictionary::Entry* entry = dictionary_->FindEntry(word);
      if (entry == nullptr) {
        continue;
      }

      // The base input may spell the word with any of its readings.
      std::vector<std::string> readings = {entry->reading};
      readings.insert(readings.end(), entry->alternates.begin(),
                      entry->alternates.end());
      const auto typed = std::find_if(
          readings.begin(), readings.end(), [&](const std::string& reading) {
            return ReadingStartsAt(input_chars, input_pos, reading);
          });
      if (typed == readings.end()) {
        continue;
      }

      reading_length = Util::CharsLen(*typed);
      for (const std::string& reading : readings) {
        if (reading == *typed || Util::CharsLen(reading) != reading_length) {
          continue;
        }
        std::string variant = absl::StrJoin(
            input_chars.begin(), input_chars.begin() + input_pos, "");
        variant.append(reading);
        variant.append(absl::StrJoin(
            input_chars.begin() + input_pos + reading_length,
            input_chars.end(), ""));
        if (seen.insert(variant).second) {
          TSUZURI_VLOG(2) << "Reading variant for " << word << ": " << variant;
          variants.push_back(std::move(variant));
        }
      }
      word_length = len;
      break;
    }

    if (word_length == 0) {
      // The span of an unregistered kanji in the input is unknown, so no
      // later word can be located.
      if (Util::IsKanji(display_chars[display_pos])) {
        TSUZURI_VLOG(2) << "Stopped at " << display_chars[display_pos];
        break;
      }
      word_length = 1;
      reading_length = 1;
    }
    display_pos += word_length;
    input_pos += reading_length;
  }
  return variants;
}

std::vector<std::string> ReadingVariationGenerator::GetAlternateReadings(
    const absl::string_view kanji_word) const {
  return dictionary_->GetAlternateReadings(kanji_word);
}

}  // namespace dictionary
}  // namespace tsuzuri
