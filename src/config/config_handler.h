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

// Handler of the engine configuration.

#ifndef TSUZURI_CONFIG_CONFIG_HANDLER_H_
#define TSUZURI_CONFIG_CONFIG_HANDLER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "protocol/engine_config.pb.h"

namespace tsuzuri {
namespace config {

// This is pure static class.  All public static methods are thread-safe.
class ConfigHandler {
 public:
  ConfigHandler() = delete;
  ConfigHandler(const ConfigHandler&) = delete;
  ConfigHandler& operator=(const ConfigHandler&) = delete;

  // Gets default config value.
  static const EngineConfig& DefaultConfig();

  // Parses a config written in protobuf text format. Fields not present in
  // `text` keep their default values.
  static absl::StatusOr<EngineConfig> ParseConfig(absl::string_view text);

  // Loads a text format config from `filename`.
  static absl::StatusOr<EngineConfig> LoadConfig(absl::string_view filename);

  // Applies process wide settings of `config` (currently the verbose log
  // level).
  static void ApplyConfig(const EngineConfig& config);
};

}  // namespace config
}  // namespace tsuzuri

#endif  // TSUZURI_CONFIG_CONFIG_HANDLER_H_
