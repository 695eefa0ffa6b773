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

#ifndef TSUZURI_ALIGNMENT_DISPLAY_SEGMENTER_H_
#define TSUZURI_ALIGNMENT_DISPLAY_SEGMENTER_H_

#include <cstddef>
#include <string>

#include "alignment/text_mapping.h"

namespace tsuzuri {

// Partition of the display text around the cursor.
struct DisplaySegments {
  std::string completed;
  // The display character being typed. Empty when the input is finished.
  std::string current;
  std::string remaining;

  bool operator==(const DisplaySegments& other) const = default;
};

// Splits the display text into the already typed part, the character being
// typed and the rest. A kanji stays in `current` until the last kana of its
// reading has been typed, so it is never split.
class DisplaySegmenter {
 public:
  DisplaySegmenter() = delete;
  ~DisplaySegmenter() = delete;

  static DisplaySegments Segment(const TextMapping& mapping,
                                 size_t input_position);
};

}  // namespace tsuzuri

#endif  // TSUZURI_ALIGNMENT_DISPLAY_SEGMENTER_H_
