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

#include "base/util.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace tsuzuri {
namespace {

constexpr bool IsUtf8TrailingByte(uint8_t c) { return (c & 0xc0) == 0x80; }

// Returns the byte length of the character starting at `s`. Ill-formed
// sequences are consumed one byte at a time.
size_t OneCharLen(absl::string_view s) {
  size_t mblen = 0;
  Util::Utf8ToCodepoint(s, &mblen);
  return mblen == 0 ? 1 : mblen;
}

}  // namespace

std::vector<std::string> Util::SplitStringToUtf8Chars(absl::string_view str) {
  std::vector<std::string> output;
  while (!str.empty()) {
    const size_t mblen = OneCharLen(str);
    output.emplace_back(str.substr(0, mblen));
    str.remove_prefix(mblen);
  }
  return output;
}

size_t Util::CharsLen(absl::string_view str) {
  size_t length = 0;
  while (!str.empty()) {
    ++length;
    str.remove_prefix(OneCharLen(str));
  }
  return length;
}

char32_t Util::Utf8ToCodepoint(absl::string_view s, size_t* mblen) {
  *mblen = 0;
  if (s.empty()) {
    return 0;
  }

  const uint8_t leading_byte = static_cast<uint8_t>(s[0]);
  if (leading_byte < 0x80) {
    *mblen = 1;
    return leading_byte;
  }
  if (IsUtf8TrailingByte(leading_byte)) {
    // UTF-8 sequence should not start trailing bytes.
    return 0;
  }

  char32_t result = 0;
  size_t len = 0;
  char32_t min_value = 0;
  if ((leading_byte & 0xe0) == 0xc0) {
    len = 2;
    min_value = 0x0080;
    result = (leading_byte & 0x1f);
  } else if ((leading_byte & 0xf0) == 0xe0) {
    len = 3;
    min_value = 0x0800;
    result = (leading_byte & 0x0f);
  } else if ((leading_byte & 0xf8) == 0xf0) {
    len = 4;
    min_value = 0x010000;
    result = (leading_byte & 0x07);
  } else {
    return 0;
  }

  if (s.size() < len) {
    // Data length is too short.
    return 0;
  }
  for (size_t i = 1; i < len; ++i) {
    const uint8_t c = static_cast<uint8_t>(s[i]);
    if (!IsUtf8TrailingByte(c)) {
      return 0;
    }
    result <<= 6;
    result += (c & 0x3f);
  }
  if (result < min_value || result > 0x10FFFF) {
    // redundant UTF-8 sequence found.
    return 0;
  }
  *mblen = len;
  return result;
}

void Util::CodepointToUtf8Append(char32_t c, std::string* output) {
  if (c == 0) {
    return;
  }
  char buf[4];
  size_t mblen = 0;
  if (c < 0x00080) {
    buf[0] = static_cast<char>(c & 0xFF);
    mblen = 1;
  } else if (c < 0x00800) {
    buf[0] = static_cast<char>(0xC0 + ((c >> 6) & 0x1F));
    buf[1] = static_cast<char>(0x80 + (c & 0x3F));
    mblen = 2;
  } else if (c < 0x10000) {
    buf[0] = static_cast<char>(0xE0 + ((c >> 12) & 0x0F));
    buf[1] = static_cast<char>(0x80 + ((c >> 6) & 0x3F));
    buf[2] = static_cast<char>(0x80 + (c & 0x3F));
    mblen = 3;
  } else {
    buf[0] = static_cast<char>(0xF0 + ((c >> 18) & 0x07));
    buf[1] = static_cast<char>(0x80 + ((c >> 12) & 0x3F));
    buf[2] = static_cast<char>(0x80 + ((c >> 6) & 0x3F));
    buf[3] = static_cast<char>(0x80 + (c & 0x3F));
    mblen = 4;
  }
  absl::StrAppend(output, absl::string_view(buf, mblen));
}

std::string Util::CodepointToUtf8(char32_t c) {
  std::string output;
  CodepointToUtf8Append(c, &output);
  return output;
}

absl::string_view Util::Utf8SubString(absl::string_view src, size_t start) {
  for (size_t i = 0; i < start && !src.empty(); ++i) {
    src.remove_prefix(OneCharLen(src));
  }
  return src;
}

absl::string_view Util::Utf8SubString(absl::string_view src, size_t start,
                                      size_t length) {
  src = Utf8SubString(src, start);
  absl::string_view rest = src;
  for (size_t l = length; l > 0 && !rest.empty(); --l) {
    rest.remove_prefix(OneCharLen(rest));
  }
  return src.substr(0, src.size() - rest.size());
}

absl::string_view Util::StripUtf8Bom(absl::string_view line) {
  static constexpr char kUtf8Bom[] = "\xef\xbb\xbf";
  return absl::StripPrefix(line, kUtf8Bom);
}

bool Util::ChopReturns(std::string* line) {
  const std::string::size_type line_end = line->find_last_not_of("\r\n");
  if (line_end + 1 != line->size()) {
    line->erase(line_end + 1);
    return true;
  }
  return false;
}

#define INRANGE(w, a, b) ((w) >= (a) && (w) <= (b))

Util::ScriptType Util::GetScriptType(char32_t codepoint) {
  if (INRANGE(codepoint, 0x0030, 0x0039) ||  // ascii number
      INRANGE(codepoint, 0xFF10, 0xFF19)) {  // full width number
    return NUMBER;
  } else if (INRANGE(codepoint, 0x0041, 0x005A) ||  // ascii upper
             INRANGE(codepoint, 0x0061, 0x007A) ||  // ascii lower
             INRANGE(codepoint, 0xFF21, 0xFF3A) ||  // fullwidth ascii upper
             INRANGE(codepoint, 0xFF41, 0xFF5A)) {  // fullwidth ascii lower
    return ALPHABET;
  } else if (codepoint == 0x3005 ||  // IDEOGRAPHIC ITERATION MARK "々"
             INRANGE(codepoint, 0x3400,
                     0x4DBF) ||  // CJK Unified Ideographs Extension A
             INRANGE(codepoint, 0x4E00, 0x9FFF) ||  // CJK Unified Ideographs
             INRANGE(codepoint, 0xF900,
                     0xFAFF) ||  // CJK Compatibility Ideographs
             INRANGE(codepoint, 0x20000,
                     0x2A6DF) ||  // CJK Unified Ideographs Extension B
             INRANGE(codepoint, 0x2A700,
                     0x2B81F) ||  // CJK Unified Ideographs Extension C, D
             INRANGE(codepoint, 0x2F800,
                     0x2FA1F)) {  // CJK Compatibility Ideographs
    return KANJI;
  } else if (INRANGE(codepoint, 0x3041, 0x309F)) {  // hiragana
    return HIRAGANA;
  } else if (INRANGE(codepoint, 0x30A1, 0x30FF) ||  // full width katakana
             INRANGE(codepoint, 0xFF65, 0xFF9F)) {  // half width katakana
    return KATAKANA;
  } else if (INRANGE(codepoint, 0x02700, 0x027BF) ||  // Dingbats
             INRANGE(codepoint, 0x1F300,
                     0x1F5FF) ||  // Miscellaneous Symbols And Pictographs
             INRANGE(codepoint, 0x1F600, 0x1F64F) ||  // Emoticons
             INRANGE(codepoint, 0x1F680,
                     0x1F6FF)) {  // Transport And Map Symbols
    return EMOJI;
  }

  return UNKNOWN_SCRIPT;
}

#undef INRANGE

bool Util::IsKanji(absl::string_view str) {
  size_t mblen = 0;
  const char32_t codepoint = Utf8ToCodepoint(str, &mblen);
  return mblen != 0 && mblen == str.size() && GetScriptType(codepoint) == KANJI;
}

}  // namespace tsuzuri
