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

#ifndef TSUZURI_ALIGNMENT_ALIGNMENT_MAPPER_H_
#define TSUZURI_ALIGNMENT_ALIGNMENT_MAPPER_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "alignment/text_mapping.h"
#include "dictionary/reading_dictionary_interface.h"
#include "dictionary/reading_variation_generator_interface.h"
#include "protocol/engine_config.pb.h"

namespace tsuzuri {

// Builds the character level mapping between a display text (which may contain
// kanji) and the kana the user has to type for it.
//
// Compound words are matched greedily: at every display position, windows from
// max_compound_length characters down to min_compound_length characters are
// looked up, and the longest one whose reading is a prefix of the remaining
// input wins. Otherwise the single display character is mapped, expanding a
// kanji into every kana of its reading.
//
// Alignment never fails. Kanji without a known reading are mapped one to one
// and alignment stops when either text is exhausted, silently dropping the
// rest of the other one.
class AlignmentMapper {
 public:
  // `dictionary` must outlive the mapper.
  explicit AlignmentMapper(
      const dictionary::ReadingDictionaryInterface* dictionary);
  AlignmentMapper(const dictionary::ReadingDictionaryInterface* dictionary,
                  const config::EngineConfig& config);

  AlignmentMapper(const AlignmentMapper&) = delete;
  AlignmentMapper& operator=(const AlignmentMapper&) = delete;

  // Builds the base mapping of `display_text` and `input_text`.
  TextMapping Align(absl::string_view display_text,
                    absl::string_view input_text) const;

  // Builds the base mapping, then attaches the reading variants produced by
  // `generator`. No variant is attached when use_reading_variations is off in
  // the config.
  TextMapping AlignWithVariants(
      absl::string_view display_text, absl::string_view base_input_text,
      const dictionary::ReadingVariationGeneratorInterface& generator) const;

  // Returns a copy of `mapping` where every kanji position holds the character
  // at the same ordinal index of each variant as its reading variations.
  // Variants too short to cover a position are skipped. Indices are left
  // untouched.
  static TextMapping AttachVariants(const TextMapping& mapping,
                                    absl::Span<const std::string> variants);

 private:
  // Returns the reading of `surface`. Empty readings are treated as unknown.
  std::optional<std::string> LookupReading(absl::string_view surface) const;

  // Tries compound windows at `display_index`. On success sets the matched
  // window length and its reading and returns true.
  bool FindCompoundWord(absl::Span<const std::string> display_chars,
                        size_t display_index,
                        absl::Span<const std::string> input_chars,
                        size_t input_index, size_t* word_length,
                        std::vector<std::string>* word_reading) const;

  // Appends the mappings of the compound word of `word_length` characters
  // starting at `display_index`. Returns the input index after the word.
  size_t AppendCompoundWord(absl::Span<const std::string> display_chars,
                            size_t display_index, size_t word_length,
                            absl::Span<const std::string> word_reading,
                            absl::Span<const std::string> input_chars,
                            size_t input_index,
                            std::vector<CharacterMapping>* mappings) const;

  // Appends the mappings of the single display character at `display_index`.
  // Returns the input index after the character.
  size_t AppendSingleCharacter(absl::Span<const std::string> display_chars,
                               size_t display_index,
                               absl::Span<const std::string> input_chars,
                               size_t input_index,
                               std::vector<CharacterMapping>* mappings) const;

  const dictionary::ReadingDictionaryInterface* dictionary_;
  const size_t max_compound_length_;
  const size_t min_compound_length_;
  const bool use_reading_variations_;
};

}  // namespace tsuzuri

#endif  // TSUZURI_ALIGNMENT_ALIGNMENT_MAPPER_H_
