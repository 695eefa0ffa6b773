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

#include "alignment/text_mapping.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "base/util.h"

namespace tsuzuri {

TextMapping::TextMapping(std::string display_text, std::string input_text,
                         std::vector<CharacterMapping> mappings)
    : display_text_(std::move(display_text)),
      input_text_(std::move(input_text)),
      mappings_(std::move(mappings)),
      total_input_length_(Util::CharsLen(input_text_)),
      display_length_(Util::CharsLen(display_text_)) {}

const CharacterMapping* TextMapping::FindByInputIndex(
    const size_t input_index) const {
  const auto it = std::find_if(mappings_.begin(), mappings_.end(),
                               [input_index](const CharacterMapping& m) {
                                 return m.input_index == input_index;
                               });
  return it == mappings_.end() ? nullptr : &*it;
}

size_t TextMapping::GetDisplayPosition(const size_t input_position) const {
  if (input_position >= mappings_.size()) {
    return display_length_;
  }
  return mappings_[input_position].display_index;
}

size_t TextMapping::GetInputPosition(const size_t display_position) const {
  for (const CharacterMapping& m : mappings_) {
    if (m.display_index == display_position) {
      return m.input_index;
    }
  }
  return 0;
}

absl::string_view TextMapping::GetTargetChar(
    const size_t input_position) const {
  if (input_position >= mappings_.size()) {
    return "";
  }
  return mappings_[input_position].input_char;
}

std::string TextMapping::DebugString() const {
  std::string output =
      absl::StrCat("display: ", display_text_, " input: ", input_text_,
                   " total_input_length: ", total_input_length_, "\n");
  for (const CharacterMapping& m : mappings_) {
    absl::StrAppend(&output, m.display_index, ":", m.display_char, " -> ",
                    m.input_index, ":", m.input_char);
    if (m.is_kanji) {
      absl::StrAppend(&output, " kanji");
    }
    if (m.kanji_word.has_value()) {
      absl::StrAppend(&output, " word=", *m.kanji_word);
    }
    if (!m.reading_variations.empty()) {
      absl::StrAppend(&output, " variations=",
                      absl::StrJoin(m.reading_variations, ","));
    }
    output.append("\n");
  }
  return output;
}

}  // namespace tsuzuri
