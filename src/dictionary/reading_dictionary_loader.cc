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

#include "dictionary/reading_dictionary_loader.h"

#include <cstddef>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "base/util.h"
#include "base/vlog.h"
#include "dictionary/reading_dictionary.h"

namespace tsuzuri {
namespace dictionary {

ReadingDictionaryLoader::ReadingDictionaryLoader(ReadingDictionary* dictionary)
    : dictionary_(dictionary) {
  CHECK(dictionary_);
}

absl::Status ReadingDictionaryLoader::LoadFromFile(
    const absl::string_view filename) {
  std::ifstream ifs{std::string(filename)};
  if (!ifs) {
    return absl::NotFoundError(absl::StrCat("Cannot open ", filename));
  }
  const int loaded_before = num_loaded_;
  if (absl::Status status = LoadFromStream(ifs); !status.ok()) {
    return status;
  }
  LOG(INFO) << (num_loaded_ - loaded_before) << " entries from " << filename;
  return absl::OkStatus();
}

absl::Status ReadingDictionaryLoader::LoadFromStream(std::istream& is) {
  std::string line;
  bool first_line = true;
  while (std::getline(is, line)) {
    Util::ChopReturns(&line);
    absl::string_view view = line;
    if (first_line) {
      view = Util::StripUtf8Bom(view);
      first_line = false;
    }
    if (view.empty() || view[0] == '#') {
      continue;
    }
    if (ParseTSVLine(view)) {
      ++num_loaded_;
    } else {
      ++num_skipped_;
    }
  }
  if (is.bad()) {
    return absl::DataLossError("I/O error while reading dictionary");
  }
  return absl::OkStatus();
}

bool ReadingDictionaryLoader::ParseTSVLine(const absl::string_view line) {
  const std::vector<absl::string_view> columns = absl::StrSplit(line, '\t');
  if (columns.size() < 2) {
    LOG(WARNING) << "Too few columns: " << line;
    return false;
  }
  const absl::string_view surface = absl::StripAsciiWhitespace(columns[0]);
  const absl::string_view reading = absl::StripAsciiWhitespace(columns[1]);

  std::vector<std::string> alternates;
  for (size_t i = 2; i < columns.size(); ++i) {
    const absl::string_view alternate = absl::StripAsciiWhitespace(columns[i]);
    if (!alternate.empty()) {
      alternates.emplace_back(alternate);
    }
  }

  if (absl::Status status =
          dictionary_->AddEntry(surface, reading, alternates);
      !status.ok()) {
    LOG(WARNING) << status << ": " << line;
    return false;
  }
  TSUZURI_VLOG(2) << "Reading entry: " << surface << " -> " << reading;
  return true;
}

}  // namespace dictionary
}  // namespace tsuzuri
