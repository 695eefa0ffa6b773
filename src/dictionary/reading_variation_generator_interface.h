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

#ifndef TSUZURI_DICTIONARY_READING_VARIATION_GENERATOR_INTERFACE_H_
#define TSUZURI_DICTIONARY_READING_VARIATION_GENERATOR_INTERFACE_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace tsuzuri {
namespace dictionary {

// Source of alternative readings, e.g. 今日 can be typed as "きょう" or
// "こんにち".
class ReadingVariationGeneratorInterface {
 public:
  virtual ~ReadingVariationGeneratorInterface() = default;

  // Returns alternative full readings of `display_text`. Each variant is
  // structurally parallel to `base_input_text`: the i-th character of a variant
  // is an alternative to the i-th character of `base_input_text`.
  virtual std::vector<std::string> GenerateVariants(
      absl::string_view display_text,
      absl::string_view base_input_text) const = 0;

  // Returns the alternate readings registered for `kanji_word`. The canonical
  // reading is not included.
  virtual std::vector<std::string> GetAlternateReadings(
      absl::string_view kanji_word) const = 0;

 protected:
  ReadingVariationGeneratorInterface() = default;
};

}  // namespace dictionary
}  // namespace tsuzuri

#endif  // TSUZURI_DICTIONARY_READING_VARIATION_GENERATOR_INTERFACE_H_
