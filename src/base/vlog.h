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

#ifndef TSUZURI_BASE_VLOG_H_
#define TSUZURI_BASE_VLOG_H_

#include "absl/log/log.h"

namespace tsuzuri {
namespace internal {

// Verbose level requested by the engine config. Never negative.
int GetEngineVerboseLevel();

// Sets the engine level. Negative levels are clamped to 0. Called by
// ConfigHandler::ApplyConfig so that base/ doesn't depend on the config.
void SetEngineVerboseLevel(int level);

// Effective verbose level: the larger of --v and the engine level.
int GetVLogLevel();

}  // namespace internal

// Overrides the engine verbose level within a scope and restores the previous
// level on destruction.
//
//   {
//     ScopedVerboseLevel verbose(2);
//     TSUZURI_VLOG(2) << "printed";
//   }
class ScopedVerboseLevel {
 public:
  explicit ScopedVerboseLevel(int level);

  ScopedVerboseLevel(const ScopedVerboseLevel&) = delete;
  ScopedVerboseLevel& operator=(const ScopedVerboseLevel&) = delete;

  ~ScopedVerboseLevel();

 private:
  const int saved_level_;
};

}  // namespace tsuzuri

#define TSUZURI_VLOG_IS_ON(level) \
  (::tsuzuri::internal::GetVLogLevel() >= (level))

#define TSUZURI_VLOG(level) LOG_IF(INFO, TSUZURI_VLOG_IS_ON(level))

#endif  // TSUZURI_BASE_VLOG_H_
