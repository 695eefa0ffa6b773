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

#ifndef TSUZURI_DICTIONARY_READING_VARIATION_GENERATOR_H_
#define TSUZURI_DICTIONARY_READING_VARIATION_GENERATOR_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "dictionary/reading_dictionary.h"
#include "dictionary/reading_variation_generator_interface.h"

namespace tsuzuri {
namespace dictionary {

// Generates reading variants from the readings registered in a
// ReadingDictionary. Words are matched longest first at the current position
// of the base reading, with whichever of their readings the base reading
// uses; every other reading of the same length yields one variant.
//
// Example:
//   dictionary: 方 -> かた (alternate: ほう)
//   GenerateVariants("この方", "このかた") = {"このほう"}
//   GenerateVariants("この方", "このほう") = {"このかた"}
//
// Only readings with the same number of characters produce a variant, because
// every variant has to stay parallel to the base reading character by
// character. 今日 -> きょう (alternate: こんにち) produces no variant.
// Characters without a dictionary word are typed as themselves. Scanning stops
// at a kanji without a matching word, since its span in the base reading is
// unknown.
class ReadingVariationGenerator : public ReadingVariationGeneratorInterface {
 public:
  // `dictionary` must outlive the generator.
  explicit ReadingVariationGenerator(const ReadingDictionary* dictionary);

  ReadingVariationGenerator(const ReadingVariationGenerator&) = delete;
  ReadingVariationGenerator& operator=(const ReadingVariationGenerator&) =
      delete;

  ~ReadingVariationGenerator() override = default;

  std::vector<std::string> GenerateVariants(
      absl::string_view display_text,
      absl::string_view base_input_text) const override;

  std::vector<std::string> GetAlternateReadings(
      absl::string_view kanji_word) const override;

 private:
  const ReadingDictionary* dictionary_;
};

}  // namespace dictionary
}  // namespace tsuzuri

#endif  // TSUZURI_DICTIONARY_READING_VARIATION_GENERATOR_H_
