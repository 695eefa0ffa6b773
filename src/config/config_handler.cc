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
#include "config/config_handler.h"

#include <fstream>
#include <sstream>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/vlog.h"
#include "google/protobuf/text_format.h"
#include "protocol/engine_config.pb.h"

namespace tsuzuri {
namespace config {
namespace {

absl::Status ValidateConfig(const EngineConfig& config) {
  if (config.min_compound_length() < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("min_compound_length must be positive: ",
                     config.min_compound_length()));
  }
  if (config.max_compound_length() < config.min_compound_length()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "max_compound_length (", config.max_compound_length(),
        ") is smaller than min_compound_length (",
        config.min_compound_length(), ")"));
  }
  if (config.verbose_level() < 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "verbose_level must not be negative: ", config.verbose_level()));
  }
  return absl::OkStatus();
}

}  // namespace

const EngineConfig& ConfigHandler::DefaultConfig() {
  return EngineConfig::default_instance();
}

absl::StatusOr<EngineConfig> ConfigHandler::ParseConfig(
    const absl::string_view text) {
  EngineConfig config;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text),
                                                     &config)) {
    return absl::InvalidArgumentError("Failed to parse engine config");
  }
  if (absl::Status status = ValidateConfig(config); !status.ok()) {
    return status;
  }
  return config;
}

absl::StatusOr<EngineConfig> ConfigHandler::LoadConfig(
    const absl::string_view filename) {
  std::ifstream ifs{std::string(filename)};
  if (!ifs) {
    return absl::NotFoundError(absl::StrCat("Cannot open ", filename));
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  absl::StatusOr<EngineConfig> config = ParseConfig(buffer.str());
  if (!config.ok()) {
    LOG(ERROR) << "Invalid config file " << filename << ": "
               << config.status();
    return config.status();
  }
  TSUZURI_VLOG(1) << "Loaded config from " << filename << ": "
                  << config->ShortDebugString();
  return config;
}

void ConfigHandler::ApplyConfig(const EngineConfig& config) {
  internal::SetEngineVerboseLevel(config.verbose_level());
}

}  // namespace config
}  // namespace tsuzuri
