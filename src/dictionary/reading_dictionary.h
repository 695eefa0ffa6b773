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

#ifndef TSUZURI_DICTIONARY_READING_DICTIONARY_H_
#define TSUZURI_DICTIONARY_READING_DICTIONARY_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "dictionary/reading_dictionary_interface.h"

namespace tsuzuri {
namespace dictionary {

// In-memory reading table keyed by surface. Every entry has one canonical
// reading and any number of alternate readings.
class ReadingDictionary : public ReadingDictionaryInterface {
 public:
  struct Entry {
    std::string reading;
    std::vector<std::string> alternates;
  };

  ReadingDictionary() = default;

  ReadingDictionary(const ReadingDictionary&) = delete;
  ReadingDictionary& operator=(const ReadingDictionary&) = delete;

  // Movable
  ReadingDictionary(ReadingDictionary&&) = default;
  ReadingDictionary& operator=(ReadingDictionary&&) = default;

  ~ReadingDictionary() override = default;

  // Registers `reading` as the canonical reading of `surface`. An existing
  // canonical reading is overwritten and `alternates` are merged into the
  // existing ones. Alternates equal to the canonical reading are dropped.
  absl::Status AddEntry(absl::string_view surface, absl::string_view reading,
                        absl::Span<const std::string> alternates = {});

  bool HasReading(absl::string_view surface) const override;
  std::optional<std::string> LookupReading(
      absl::string_view surface) const override;
  bool IsKanji(absl::string_view ch) const override;

  // Returns the alternate readings of `surface`. Empty if `surface` is not
  // registered or has no alternates.
  std::vector<std::string> GetAlternateReadings(
      absl::string_view surface) const;

  // Returns nullptr if `surface` is not registered.
  const Entry* FindEntry(absl::string_view surface) const;

  // Length of the longest registered surface in characters.
  size_t max_surface_length() const { return max_surface_length_; }

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  void Clear();

 private:
  absl::flat_hash_map<std::string, Entry> entries_;
  size_t max_surface_length_ = 0;
};

}  // namespace dictionary
}  // namespace tsuzuri

#endif  // TSUZURI_DICTIONARY_READING_DICTIONARY_H_
