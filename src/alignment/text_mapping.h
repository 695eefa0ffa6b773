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

#ifndef TSUZURI_ALIGNMENT_TEXT_MAPPING_H_
#define TSUZURI_ALIGNMENT_TEXT_MAPPING_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace tsuzuri {

// Correspondence of one kana of the input text to the display character it is
// typed for. All indices count Unicode characters, not bytes.
struct CharacterMapping {
  // Index into the display text this kana belongs to.
  size_t display_index = 0;
  // Index into the input text. Unique and strictly increasing over a mapping.
  size_t input_index = 0;
  std::string display_char;
  std::string input_char;
  // True if display_char is a kanji (as opposed to kana or punctuation passed
  // through verbatim).
  bool is_kanji = false;
  // The word this kana was attributed to. Set for every kana of a compound
  // word match and of a single kanji with a known reading.
  std::optional<std::string> kanji_word;
  // Alternative kana valid at this exact input position.
  std::vector<std::string> reading_variations;

  bool operator==(const CharacterMapping& other) const = default;
};

// Immutable result of aligning a display text with its input text.
//
// Example:
//   display: "木の上"   input: "きのうえ"
//   mappings:
//     {display_index: 0, input_index: 0, 木 -> き, is_kanji, kanji_word: 木}
//     {display_index: 1, input_index: 1, の -> の}
//     {display_index: 2, input_index: 2, 上 -> う, is_kanji, kanji_word: 上}
//     {display_index: 2, input_index: 3, 上 -> え, is_kanji, kanji_word: 上}
class TextMapping {
 public:
  TextMapping() = default;
  TextMapping(std::string display_text, std::string input_text,
              std::vector<CharacterMapping> mappings);

  // Copyable and movable.
  TextMapping(const TextMapping&) = default;
  TextMapping& operator=(const TextMapping&) = default;
  TextMapping(TextMapping&&) = default;
  TextMapping& operator=(TextMapping&&) = default;

  absl::string_view display_text() const { return display_text_; }
  absl::string_view input_text() const { return input_text_; }
  absl::Span<const CharacterMapping> mappings() const { return mappings_; }

  // Number of characters of the input text. This can be larger than
  // mappings().size() when the reading data doesn't cover the whole input.
  size_t total_input_length() const { return total_input_length_; }

  // Number of characters of the display text.
  size_t display_length() const { return display_length_; }

  // Returns the mapping whose input_index is `input_index`, or nullptr.
  const CharacterMapping* FindByInputIndex(size_t input_index) const;

  // Returns the display index owning `input_position`. Returns
  // display_length() if the position is past the mapping.
  size_t GetDisplayPosition(size_t input_position) const;

  // Returns the input index of the first kana typed for the display character
  // at `display_position`, or 0 if there is none.
  size_t GetInputPosition(size_t display_position) const;

  // Returns the kana to be typed at `input_position`. Returns an empty string
  // if the position is past the mapping.
  absl::string_view GetTargetChar(size_t input_position) const;

  std::string DebugString() const;

  bool operator==(const TextMapping& other) const = default;

 private:
  std::string display_text_;
  std::string input_text_;
  std::vector<CharacterMapping> mappings_;
  size_t total_input_length_ = 0;
  size_t display_length_ = 0;
};

}  // namespace tsuzuri

#endif  // TSUZURI_ALIGNMENT_TEXT_MAPPING_H_
