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

#include "session/typing_session.h"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "alignment/display_segmenter.h"
#include "alignment/position_validator.h"
#include "alignment/text_mapping.h"
#include "base/util.h"
#include "base/vlog.h"

namespace tsuzuri {
namespace session {

TypingSession::TypingSession(TextMapping mapping,
                             const PositionValidator* validator,
                             const bool allow_backspace)
    : mapping_(std::move(mapping)),
      validator_(validator),
      allow_backspace_(allow_backspace) {
  CHECK(validator_);
}

TypingSession::InputResult TypingSession::UpdateInput(
    const absl::string_view text) {
  if (IsFinished()) {
    return FINISHED;
  }

  buffer_ = std::string(text);
  const ValidationResult result =
      validator_->Validate(mapping_, buffer_, position_, observer_);
  if (result.is_complete) {
    ++position_;
    buffer_.clear();
    TSUZURI_VLOG(1) << "Advanced to " << position_ << "/"
                    << mapping_.total_input_length();
    return IsFinished() ? FINISHED : ADVANCED;
  }
  if (!result.can_continue && !buffer_.empty()) {
    TSUZURI_VLOG(1) << "Rejected \"" << buffer_ << "\" at " << position_;
    buffer_.clear();
    return REJECTED;
  }
  return PENDING;
}

bool TypingSession::Backspace() {
  if (!buffer_.empty()) {
    const size_t length = Util::CharsLen(buffer_);
    buffer_ = std::string(Util::Utf8SubString(buffer_, 0, length - 1));
    return true;
  }
  if (allow_backspace_ && position_ > 0) {
    --position_;
    return true;
  }
  return false;
}

void TypingSession::Reset() {
  position_ = 0;
  buffer_.clear();
}

bool TypingSession::IsFinished() const {
  // A truncated alignment has fewer entries than input characters. The
  // session ends with the last playable position.
  return position_ >= mapping_.total_input_length() ||
         position_ >= mapping_.mappings().size();
}

int TypingSession::ProgressPercent() const {
  const size_t total = mapping_.total_input_length();
  if (total == 0) {
    return 100;
  }
  return static_cast<int>(
      std::lround(100.0 * static_cast<double>(position_) / total));
}

DisplaySegments TypingSession::CurrentSegments() const {
  return DisplaySegmenter::Segment(mapping_, position_);
}

absl::string_view TypingSession::TargetChar() const {
  return mapping_.GetTargetChar(position_);
}

}  // namespace session
}  // namespace tsuzuri
