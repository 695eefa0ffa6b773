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

#include "dictionary/reading_dictionary.h"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "base/util.h"

namespace tsuzuri {
namespace dictionary {

absl::Status ReadingDictionary::AddEntry(
    const absl::string_view surface, const absl::string_view reading,
    const absl::Span<const std::string> alternates) {
  if (surface.empty()) {
    return absl::InvalidArgumentError("Empty surface");
  }
  if (reading.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Empty reading for ", surface));
  }

  Entry& entry = entries_[std::string(surface)];
  entry.reading = std::string(reading);
  for (const std::string& alternate : alternates) {
    if (alternate.empty()) {
      continue;
    }
    if (std::find(entry.alternates.begin(), entry.alternates.end(),
                  alternate) == entry.alternates.end()) {
      entry.alternates.push_back(alternate);
    }
  }
  // The canonical reading may have been one of the previous alternates.
  entry.alternates.erase(std::remove(entry.alternates.begin(),
                                     entry.alternates.end(), entry.reading),
                         entry.alternates.end());

  max_surface_length_ = std::max(max_surface_length_, Util::CharsLen(surface));
  return absl::OkStatus();
}

bool ReadingDictionary::HasReading(const absl::string_view surface) const {
  return entries_.contains(surface);
}

std::optional<std::string> ReadingDictionary::LookupReading(
    const absl::string_view surface) const {
  const Entry* entry = FindEntry(surface);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return entry->reading;
}

bool ReadingDictionary::IsKanji(const absl::string_view ch) const {
  return Util::IsKanji(ch);
}

std::vector<std::string> ReadingDictionary::GetAlternateReadings(
    const absl::string_view surface) const {
  const Entry* entry = FindEntry(surface);
  if (entry == nullptr) {
    return {};
  }
  return entry->alternates;
}

const ReadingDictionary::Entry* ReadingDictionary::FindEntry(
    const absl::string_view surface) const {
  const auto it = entries_.find(surface);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

void ReadingDictionary::Clear() {
  entries_.clear();
  max_surface_length_ = 0;
}

}  // namespace dictionary
}  // namespace tsuzuri
