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

#include "alignment/alignment_mapper.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "alignment/text_mapping.h"
#include "base/util.h"
#include "base/vlog.h"
#include "config/config_handler.h"
#include "dictionary/reading_dictionary_interface.h"
#include "dictionary/reading_variation_generator_interface.h"
#include "protocol/engine_config.pb.h"

namespace tsuzuri {
namespace {

CharacterMapping MakeMapping(size_t display_index, size_t input_index,
                             absl::string_view display_char,
                             absl::string_view input_char, bool is_kanji,
                             std::optional<std::string> kanji_word) {
  CharacterMapping mapping;
  mapping.display_index = display_index;
  mapping.input_index = input_index;
  mapping.display_char = std::string(display_char);
  mapping.input_char = std::string(input_char);
  mapping.is_kanji = is_kanji;
  mapping.kanji_word = std::move(kanji_word);
  return mapping;
}

}  // namespace

AlignmentMapper::AlignmentMapper(
    const dictionary::ReadingDictionaryInterface* dictionary)
    : AlignmentMapper(dictionary, config::ConfigHandler::DefaultConfig()) {}

AlignmentMapper::AlignmentMapper(
    const dictionary::ReadingDictionaryInterface* dictionary,
    const config::EngineConfig& config)
    : dictionary_(dictionary),
      max_compound_length_(
          static_cast<size_t>(std::max(config.max_compound_length(), 1))),
      min_compound_length_(
          static_cast<size_t>(std::max(config.min_compound_length(), 1))),
      use_reading_variations_(config.use_reading_variations()) {
  CHECK(dictionary_);
}

std::optional<std::string> AlignmentMapper::LookupReading(
    absl::string_view surface) const {
  std::optional<std::string> reading = dictionary_->LookupReading(surface);
  if (reading.has_value() && reading->empty()) {
    return std::nullopt;
  }
  return reading;
}

bool AlignmentMapper::FindCompoundWord(
    absl::Span<const std::string> display_chars, size_t display_index,
    absl::Span<const std::string> input_chars, size_t input_index,
    size_t* word_length, std::vector<std::string>* word_reading) const {
  const size_t remaining = display_chars.size() - display_index;
  const size_t max_length = std::min(max_compound_length_, remaining);
  for (size_t length = max_length; length >= min_compound_length_; --length) {
    const std::string word =
        absl::StrJoin(display_chars.subspan(display_index, length), "");
    const std::optional<std::string> reading = LookupReading(word);
    if (!reading.has_value()) {
      continue;
    }
    std::vector<std::string> reading_chars =
        Util::SplitStringToUtf8Chars(*reading);
    if (reading_chars.size() > input_chars.size() - input_index ||
        !std::equal(reading_chars.begin(), reading_chars.end(),
                    input_chars.begin() + input_index)) {
      continue;
    }
    *word_length = length;
    *word_reading = std::move(reading_chars);
    return true;
  }
  return false;
}

size_t AlignmentMapper::AppendCompoundWord(
    absl::Span<const std::string> display_chars, size_t display_index,
    size_t word_length, absl::Span<const std::string> word_reading,
    absl::Span<const std::string> input_chars, size_t input_index,
    std::vector<CharacterMapping>* mappings) const {
  const std::string word =
      absl::StrJoin(display_chars.subspan(display_index, word_length), "");
  TSUZURI_VLOG(1) << "Compound word: " << word << " -> "
                  << absl::StrJoin(word_reading, "");

  size_t current = input_index;
  for (size_t i = 0; i < word_length; ++i) {
    const std::string& ch = display_chars[display_index + i];
    if (!dictionary_->IsKanji(ch)) {
      // Kana inside a compound word maps to exactly one input character.
      if (current < input_chars.size()) {
        mappings->push_back(MakeMapping(display_index + i, current, ch,
                                        input_chars[current], false, word));
      }
      ++current;
      continue;
    }

    size_t char_length = 0;
    if (const std::optional<std::string> reading = LookupReading(ch);
        reading.has_value()) {
      char_length = Util::CharsLen(*reading);
    } else {
      // Splits the rest of the word reading evenly over the rest of the word.
      const size_t consumed = current - input_index;
      const size_t remaining_reading =
          consumed < word_reading.size() ? word_reading.size() - consumed : 0;
      char_length = std::max<size_t>(1, remaining_reading / (word_length - i));
      TSUZURI_VLOG(2) << "No reading for " << ch << " in " << word
                      << ", assigning " << char_length << " characters";
    }

    for (size_t j = 0; j < char_length; ++j) {
      if (current + j >= input_chars.size()) {
        break;
      }
      mappings->push_back(MakeMapping(display_index + i, current + j, ch,
                                      input_chars[current + j], true, word));
    }
    current += char_length;
  }
  return current;
}

size_t AlignmentMapper::AppendSingleCharacter(
    absl::Span<const std::string> display_chars, size_t display_index,
    absl::Span<const std::string> input_chars, size_t input_index,
    std::vector<CharacterMapping>* mappings) const {
  const std::string& ch = display_chars[display_index];
  if (!dictionary_->IsKanji(ch)) {
    mappings->push_back(MakeMapping(display_index, input_index, ch,
                                    input_chars[input_index], false,
                                    std::nullopt));
    return input_index + 1;
  }

  std::optional<std::string> reading;
  if (dictionary_->HasReading(ch)) {
    reading = LookupReading(ch);
  }
  if (!reading.has_value()) {
    // Without a reading the kanji is typed like a plain character, so no
    // alternate readings or variations are attached to it.
    TSUZURI_VLOG(1) << "Unknown kanji: " << ch;
    mappings->push_back(MakeMapping(display_index, input_index, ch,
                                    input_chars[input_index], false,
                                    std::nullopt));
    return input_index + 1;
  }

  const size_t reading_length = Util::CharsLen(*reading);
  for (size_t i = 0; i < reading_length; ++i) {
    if (input_index + i >= input_chars.size()) {
      break;
    }
    mappings->push_back(MakeMapping(display_index, input_index + i, ch,
                                    input_chars[input_index + i], true, ch));
  }
  return input_index + reading_length;
}

TextMapping AlignmentMapper::Align(absl::string_view display_text,
                                   absl::string_view input_text) const {
  const std::vector<std::string> display_chars =
      Util::SplitStringToUtf8Chars(display_text);
  const std::vector<std::string> input_chars =
      Util::SplitStringToUtf8Chars(input_text);

  std::vector<CharacterMapping> mappings;
  mappings.reserve(input_chars.size());

  size_t display_index = 0;
  size_t input_index = 0;
  while (display_index < display_chars.size() &&
         input_index < input_chars.size()) {
    size_t word_length = 0;
    std::vector<std::string> word_reading;
    if (FindCompoundWord(display_chars, display_index, input_chars,
                         input_index, &word_length, &word_reading)) {
      input_index =
          AppendCompoundWord(display_chars, display_index, word_length,
                             word_reading, input_chars, input_index, &mappings);
      display_index += word_length;
      continue;
    }
    input_index = AppendSingleCharacter(display_chars, display_index,
                                        input_chars, input_index, &mappings);
    ++display_index;
  }

  if (display_index != display_chars.size() ||
      input_index != input_chars.size()) {
    LOG(WARNING) << "Display and input are not fully aligned: display "
                 << display_index << "/" << display_chars.size() << ", input "
                 << input_index << "/" << input_chars.size() << " ("
                 << display_text << ", " << input_text << ")";
  }

  return TextMapping(std::string(display_text), std::string(input_text),
                     std::move(mappings));
}

TextMapping AlignmentMapper::AlignWithVariants(
    absl::string_view display_text, absl::string_view base_input_text,
    const dictionary::ReadingVariationGeneratorInterface& generator) const {
  std::vector<std::string> variants;
  if (use_reading_variations_) {
    variants = generator.GenerateVariants(display_text, base_input_text);
  }
  return AttachVariants(Align(display_text, base_input_text), variants);
}

// static
TextMapping AlignmentMapper::AttachVariants(
    const TextMapping& mapping, absl::Span<const std::string> variants) {
  std::vector<std::vector<std::string>> variant_chars;
  variant_chars.reserve(variants.size());
  for (const std::string& variant : variants) {
    variant_chars.push_back(Util::SplitStringToUtf8Chars(variant));
  }

  std::vector<CharacterMapping> mappings(mapping.mappings().begin(),
                                         mapping.mappings().end());
  for (size_t i = 0; i < mappings.size(); ++i) {
    CharacterMapping& m = mappings[i];
    if (!m.is_kanji) {
      continue;
    }
    m.reading_variations.clear();
    for (const std::vector<std::string>& chars : variant_chars) {
      if (i < chars.size() && !chars[i].empty()) {
        m.reading_variations.push_back(chars[i]);
      }
    }
  }
  return TextMapping(std::string(mapping.display_text()),
                     std::string(mapping.input_text()), std::move(mappings));
}

}  // namespace tsuzuri
