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

#ifndef TSUZURI_BASE_UTIL_H_
#define TSUZURI_BASE_UTIL_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace tsuzuri {

class Util {
 public:
  Util() = delete;
  ~Util() = delete;

  // Splits a string into UTF8 chars.
  static std::vector<std::string> SplitStringToUtf8Chars(absl::string_view str);

  // Returns the number of Unicode characters in `str`.
  static size_t CharsLen(absl::string_view str);

  // Converts the first character of UTF-8 string to a codepoint. `mblen`
  // receives the byte length of the character, or 0 if the sequence is
  // ill-formed.
  static char32_t Utf8ToCodepoint(absl::string_view s, size_t* mblen);
  static char32_t Utf8ToCodepoint(absl::string_view s) {
    size_t mblen = 0;
    return Utf8ToCodepoint(s, &mblen);
  }

  // Appends a single Unicode character represented by a char32_t code point
  // to `output`. A null character is ignored.
  static void CodepointToUtf8Append(char32_t c, std::string* output);
  static std::string CodepointToUtf8(char32_t c);

  // Returns a substring of `src` by the number of Unicode characters. The
  // result is clipped when `src` is not long enough.
  static absl::string_view Utf8SubString(absl::string_view src, size_t start);
  static absl::string_view Utf8SubString(absl::string_view src, size_t start,
                                         size_t length);

  // Removes the UTF-8 BOM at the beginning of `line` if any.
  static absl::string_view StripUtf8Bom(absl::string_view line);

  // Chops '\r' and '\n' at the end of `line`. Returns true if the line was
  // modified.
  static bool ChopReturns(std::string* line);

  enum ScriptType {
    UNKNOWN_SCRIPT,
    KATAKANA,
    HIRAGANA,
    KANJI,
    NUMBER,
    ALPHABET,
    EMOJI,
    SCRIPT_TYPE_SIZE,
  };

  // Returns the script type of `codepoint`.
  static ScriptType GetScriptType(char32_t codepoint);

  // Returns true if `str` is a single kanji character.
  static bool IsKanji(absl::string_view str);
};

}  // namespace tsuzuri

#endif  // TSUZURI_BASE_UTIL_H_
