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

#ifndef TSUZURI_DICTIONARY_READING_DICTIONARY_INTERFACE_H_
#define TSUZURI_DICTIONARY_READING_DICTIONARY_INTERFACE_H_

#include <optional>
#include <string>

#include "absl/strings/string_view.h"

namespace tsuzuri {
namespace dictionary {

// ReadingDictionaryInterface maps a display unit to the kana the user has to
// type for it. A display unit is either a single character or a compound word
// of several characters. It only defines pure immutable lookup operations.
class ReadingDictionaryInterface {
 public:
  virtual ~ReadingDictionaryInterface() = default;

  // Returns true if the dictionary has a reading for `surface`.
  virtual bool HasReading(absl::string_view surface) const = 0;

  // Returns the canonical kana reading of `surface`, or std::nullopt if the
  // reading is unknown.
  virtual std::optional<std::string> LookupReading(
      absl::string_view surface) const = 0;

  // Returns true if the single character `ch` is a kanji.
  virtual bool IsKanji(absl::string_view ch) const = 0;

 protected:
  ReadingDictionaryInterface() = default;
};

}  // namespace dictionary
}  // namespace tsuzuri

#endif  // TSUZURI_DICTIONARY_READING_DICTIONARY_INTERFACE_H_
