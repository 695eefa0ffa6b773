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

#include "alignment/display_segmenter.h"

#include <algorithm>
#include <cstddef>
#include <string>

#include "absl/strings/string_view.h"
#include "alignment/text_mapping.h"
#include "base/util.h"

namespace tsuzuri {

// static
DisplaySegments DisplaySegmenter::Segment(const TextMapping& mapping,
                                          size_t input_position) {
  const absl::string_view display = mapping.display_text();
  const CharacterMapping* target = mapping.FindByInputIndex(input_position);
  if (target == nullptr) {
    return {std::string(display), "", ""};
  }

  const size_t display_position = target->display_index;
  bool in_progress = true;
  if (target->is_kanji) {
    const auto mappings = mapping.mappings();
    in_progress = std::any_of(
        mappings.begin(), mappings.end(), [&](const CharacterMapping& m) {
          return m.display_index == display_position &&
                 m.input_index >= input_position;
        });
  }

  if (!in_progress) {
    return {std::string(Util::Utf8SubString(display, 0, display_position + 1)),
            "", std::string(Util::Utf8SubString(display, display_position + 1))};
  }
  return {std::string(Util::Utf8SubString(display, 0, display_position)),
          std::string(Util::Utf8SubString(display, display_position, 1)),
          std::string(Util::Utf8SubString(display, display_position + 1))};
}

}  // namespace tsuzuri
