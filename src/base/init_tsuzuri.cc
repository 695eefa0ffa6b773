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

#include "base/init_tsuzuri.h"

#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "base/log_file.h"

// Even if log_dir is modified in the middle of the process, the
// logging directory will not be changed because the log sink is
// registered in the very early initialization stage.
ABSL_FLAG(std::string, log_dir, "",
          "If specified, logfiles are written into this directory "
          "in addition to stderr.");

namespace tsuzuri {
namespace {

std::string Basename(const std::string& path) {
  const std::string::size_type pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string GetLogFilePathFromProgramName(const std::string& program_name) {
  const std::string basename = Basename(program_name) + ".log";
  std::string log_dir = absl::GetFlag(FLAGS_log_dir);
  if (!log_dir.empty() && log_dir.back() != '/') {
    log_dir += '/';
  }
  return log_dir + basename;
}

}  // namespace

void InitTsuzuri(const char* arg0, int* argc, char*** argv) {
  const std::string program_name = *argc > 0 ? (*argv)[0] : arg0;
  absl::ParseCommandLine(*argc, *argv);

  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  if (!absl::GetFlag(FLAGS_log_dir).empty()) {
    const std::string path = GetLogFilePathFromProgramName(program_name);
    if (const absl::Status status = RegisterLogFileSink(path); !status.ok()) {
      LOG(ERROR) << status;
    }
  }
}

}  // namespace tsuzuri
