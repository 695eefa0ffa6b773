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

#ifndef TSUZURI_SESSION_TYPING_SESSION_H_
#define TSUZURI_SESSION_TYPING_SESSION_H_

#include <cstddef>
#include <string>

#include "absl/strings/string_view.h"
#include "alignment/display_segmenter.h"
#include "alignment/position_validator.h"
#include "alignment/text_mapping.h"

namespace tsuzuri {
namespace session {

// Drives one practice passage: owns the cursor into the input text and the
// kana the user is currently entering, and advances the cursor as positions
// are completed.
class TypingSession {
 public:
  enum InputResult {
    // The position was completed and the cursor moved to the next one.
    ADVANCED,
    // The last position was completed. Every later update also returns this.
    FINISHED,
    // The input can never complete the position. The buffer was cleared.
    REJECTED,
    // The input is a valid prefix. The buffer is kept.
    PENDING,
  };

  // `validator` must outlive the session.
  TypingSession(TextMapping mapping, const PositionValidator* validator,
                bool allow_backspace);

  TypingSession(const TypingSession&) = delete;
  TypingSession& operator=(const TypingSession&) = delete;

  // Replaces the input buffer with `text` and validates it at the cursor.
  InputResult UpdateInput(absl::string_view text);

  // Deletes the last character of the buffer. With an empty buffer, moves the
  // cursor back by one if backspace is allowed. Returns false if nothing
  // changed.
  bool Backspace();

  // Moves the cursor back to the beginning and clears the buffer.
  void Reset();

  // Returns true once every mapped position has been completed.
  bool IsFinished() const;

  // Rounded percentage of the input text completed so far. 100 for an empty
  // text.
  int ProgressPercent() const;

  DisplaySegments CurrentSegments() const;

  // The kana expected at the cursor, or an empty string when finished.
  absl::string_view TargetChar() const;

  size_t position() const { return position_; }
  const std::string& buffer() const { return buffer_; }
  const TextMapping& mapping() const { return mapping_; }

  // `observer` may be nullptr and must outlive the session otherwise.
  void set_observer(ValidationObserverInterface* observer) {
    observer_ = observer;
  }

 private:
  const TextMapping mapping_;
  const PositionValidator* validator_;
  const bool allow_backspace_;
  ValidationObserverInterface* observer_ = nullptr;
  size_t position_ = 0;
  std::string buffer_;
};

}  // namespace session
}  // namespace tsuzuri

#endif  // TSUZURI_SESSION_TYPING_SESSION_H_
