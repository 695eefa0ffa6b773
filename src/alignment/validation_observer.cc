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

#include "alignment/validation_observer.h"

#include <cstddef>

#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "alignment/position_validator.h"
#include "base/vlog.h"
#include "composer/sequential_input_validator_interface.h"

namespace tsuzuri {

void LoggingValidationObserver::OnSequentialCheck(
    absl::string_view user_input, absl::string_view target_char,
    const composer::SequentialInputResult& result) {
  TSUZURI_VLOG(2) << "Sequential check: input=\"" << user_input
                  << "\" target=\"" << target_char
                  << "\" valid=" << result.is_valid
                  << " complete=" << result.is_complete
                  << " continue=" << result.can_continue
                  << " confidence=" << result.confidence << " path="
                  << absl::StrJoin(result.transformation_path, ",");
}

void LoggingValidationObserver::OnValidated(absl::string_view user_input,
                                            size_t input_position,
                                            const ValidationResult& result) {
  TSUZURI_VLOG(1) << "Validate: position=" << input_position << " input=\""
                  << user_input << "\" valid=" << result.is_valid
                  << " complete=" << result.is_complete
                  << " continue=" << result.can_continue << " possible="
                  << absl::StrJoin(result.possible_chars, ",");
}

}  // namespace tsuzuri
