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

#ifndef TSUZURI_COMPOSER_SEQUENTIAL_INPUT_VALIDATOR_INTERFACE_H_
#define TSUZURI_COMPOSER_SEQUENTIAL_INPUT_VALIDATOR_INTERFACE_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace tsuzuri {
namespace composer {

struct SequentialInputResult {
  // The partial input is the target or a legal step toward it.
  bool is_valid = false;
  // The partial input is exactly the target.
  bool is_complete = false;
  // More keystrokes can still turn the partial input into the target.
  bool can_continue = false;
  // How far along the transformation the partial input is, in [0, 1].
  double confidence = 0.0;
  // Human readable description of the transformation, e.g. "は→ば→ぱ".
  std::string hint;
  // Kana reachable from the partial input on the way to the target.
  std::vector<std::string> next_possible_chars;
  // Full transformation chain from its base form up to the target.
  std::vector<std::string> transformation_path;
};

// Decides whether a partial kana buffer can still evolve into a single target
// kana, e.g. typing "は" on the way to "ぱ" (は→ば→ぱ).
//
// Implementations must treat `partial_input == target_char` as valid and
// complete, any earlier step of a legal transformation toward `target_char` as
// valid and continuable, and anything else as invalid.
class SequentialInputValidatorInterface {
 public:
  virtual ~SequentialInputValidatorInterface() = default;

  virtual SequentialInputResult Check(absl::string_view partial_input,
                                      absl::string_view target_char) const = 0;

 protected:
  SequentialInputValidatorInterface() = default;
};

}  // namespace composer
}  // namespace tsuzuri

#endif  // TSUZURI_COMPOSER_SEQUENTIAL_INPUT_VALIDATOR_INTERFACE_H_
