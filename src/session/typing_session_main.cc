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

// Interactive practice driver.
//
// Usage:
// tsuzuri_practice --dictionary data/readings.tsv --display 木の上
//                  --input きのうえ [--config engine_config.textproto]
//
// Every line read from stdin replaces the input buffer. A line "!" is a
// backspace.

#include <iostream>
#include <ostream>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "alignment/alignment_mapper.h"
#include "alignment/display_segmenter.h"
#include "alignment/position_validator.h"
#include "alignment/text_mapping.h"
#include "alignment/validation_observer.h"
#include "base/init_tsuzuri.h"
#include "base/vlog.h"
#include "composer/kana_transition_validator.h"
#include "config/config_handler.h"
#include "dictionary/reading_dictionary.h"
#include "dictionary/reading_dictionary_loader.h"
#include "dictionary/reading_variation_generator.h"
#include "protocol/engine_config.pb.h"
#include "session/typing_session.h"

ABSL_FLAG(std::string, dictionary, "", "Reading dictionary in TSV format.");
ABSL_FLAG(std::string, config, "", "Engine config in protobuf text format.");
ABSL_FLAG(std::string, display, "", "Display text to practice.");
ABSL_FLAG(std::string, input, "", "Kana reading of the display text.");

namespace tsuzuri {
namespace {

const char* InputResultName(const session::TypingSession::InputResult result) {
  switch (result) {
    case session::TypingSession::ADVANCED:
      return "ADVANCED";
    case session::TypingSession::FINISHED:
      return "FINISHED";
    case session::TypingSession::REJECTED:
      return "REJECTED";
    case session::TypingSession::PENDING:
      return "PENDING";
  }
  return "UNKNOWN";
}

void Show(const session::TypingSession& session) {
  const DisplaySegments segments = session.CurrentSegments();
  std::cout << segments.completed << "[" << segments.current << "]"
            << segments.remaining << " " << session.position() << "/"
            << session.mapping().total_input_length() << " ("
            << session.ProgressPercent() << "%)";
  if (!session.buffer().empty()) {
    std::cout << " buffer=" << session.buffer();
  }
  std::cout << std::endl;
}

absl::StatusOr<config::EngineConfig> LoadEngineConfig() {
  const std::string path = absl::GetFlag(FLAGS_config);
  if (path.empty()) {
    return config::ConfigHandler::DefaultConfig();
  }
  return config::ConfigHandler::LoadConfig(path);
}

int Run() {
  absl::StatusOr<config::EngineConfig> config = LoadEngineConfig();
  if (!config.ok()) {
    LOG(ERROR) << "Failed to load config: " << config.status();
    return 1;
  }
  config::ConfigHandler::ApplyConfig(*config);

  dictionary::ReadingDictionary dictionary;
  if (const std::string path = absl::GetFlag(FLAGS_dictionary);
      !path.empty()) {
    dictionary::ReadingDictionaryLoader loader(&dictionary);
    if (const absl::Status status = loader.LoadFromFile(path); !status.ok()) {
      LOG(ERROR) << "Failed to load dictionary: " << status;
      return 1;
    }
  }

  const std::string display = absl::GetFlag(FLAGS_display);
  const std::string input = absl::GetFlag(FLAGS_input);
  if (display.empty() || input.empty()) {
    LOG(ERROR) << "--display and --input are required";
    return 1;
  }

  const dictionary::ReadingVariationGenerator generator(&dictionary);
  const composer::KanaTransitionValidator sequential;
  const AlignmentMapper mapper(&dictionary, *config);
  const PositionValidator validator(&generator, &sequential);

  TextMapping mapping = mapper.AlignWithVariants(display, input, generator);
  TSUZURI_VLOG(1) << mapping.DebugString();
  if (mapping.mappings().size() != mapping.total_input_length()) {
    LOG(WARNING) << "Only " << mapping.mappings().size() << " of "
                 << mapping.total_input_length()
                 << " input characters are playable";
  }

  LoggingValidationObserver observer;
  session::TypingSession session(std::move(mapping), &validator,
                                 config->allow_backspace());
  session.set_observer(&observer);

  Show(session);
  std::string line;
  while (!session.IsFinished() && std::getline(std::cin, line)) {
    if (line == "!") {
      if (!session.Backspace()) {
        std::cout << "NOTHING TO DELETE" << std::endl;
      }
    } else {
      std::cout << InputResultName(session.UpdateInput(line)) << std::endl;
    }
    Show(session);
  }
  return 0;
}

}  // namespace
}  // namespace tsuzuri

int main(int argc, char** argv) {
  tsuzuri::InitTsuzuri(argv[0], &argc, &argv);
  return tsuzuri::Run();
}
