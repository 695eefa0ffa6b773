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

#ifndef TSUZURI_DICTIONARY_READING_DICTIONARY_LOADER_H_
#define TSUZURI_DICTIONARY_READING_DICTIONARY_LOADER_H_

#include <istream>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "dictionary/reading_dictionary.h"

namespace tsuzuri {
namespace dictionary {

// Loads reading entries from TSV text into a ReadingDictionary.
//
// Format (one entry per line):
//   surface<TAB>reading[<TAB>alternate_reading]...
//
// Empty lines and lines starting with '#' are ignored. Malformed lines are
// skipped and counted in num_skipped().
class ReadingDictionaryLoader {
 public:
  // `dictionary` must outlive the loader.
  explicit ReadingDictionaryLoader(ReadingDictionary* dictionary);

  ReadingDictionaryLoader(const ReadingDictionaryLoader&) = delete;
  ReadingDictionaryLoader& operator=(const ReadingDictionaryLoader&) = delete;

  // Adds the entries of `filename` to the dictionary. Returns NotFoundError if
  // the file cannot be opened.
  absl::Status LoadFromFile(absl::string_view filename);

  // Adds the entries read from `is` to the dictionary.
  absl::Status LoadFromStream(std::istream& is);

  // Counters accumulated over all Load calls.
  int num_loaded() const { return num_loaded_; }
  int num_skipped() const { return num_skipped_; }

 private:
  // Returns false if `line` is malformed.
  bool ParseTSVLine(absl::string_view line);

  ReadingDictionary* dictionary_;
  int num_loaded_ = 0;
  int num_skipped_ = 0;
};

}  // namespace dictionary
}  // namespace tsuzuri

#endif  // TSUZURI_DICTIONARY_READING_DICTIONARY_LOADER_H_
