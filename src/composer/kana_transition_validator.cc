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

#include "composer/kana_transition_validator.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "base/util.h"

namespace tsuzuri {
namespace composer {
namespace {

// Hiragana transformation chains, in the order the modifier key cycles them.
// Katakana chains are derived from these.
constexpr absl::string_view kHiraganaChains[][3] = {
    {"か", "が"},       {"き", "ぎ"},       {"く", "ぐ"},
    {"け", "げ"},       {"こ", "ご"},       {"さ", "ざ"},
    {"し", "じ"},       {"す", "ず"},       {"せ", "ぜ"},
    {"そ", "ぞ"},       {"た", "だ"},       {"ち", "ぢ"},
    {"つ", "っ", "づ"}, {"て", "で"},       {"と", "ど"},
    {"は", "ば", "ぱ"}, {"ひ", "び", "ぴ"}, {"ふ", "ぶ", "ぷ"},
    {"へ", "べ", "ぺ"}, {"ほ", "ぼ", "ぽ"}, {"あ", "ぁ"},
    {"い", "ぃ"},       {"う", "ぅ", "ゔ"}, {"え", "ぇ"},
    {"お", "ぉ"},       {"や", "ゃ"},       {"ゆ", "ゅ"},
    {"よ", "ょ"},       {"わ", "ゎ"},
};

// Offset between a hiragana and the corresponding full-width katakana.
constexpr char32_t kKatakanaOffset = 0x30A1 - 0x3041;

std::string HiraganaToKatakana(absl::string_view hiragana) {
  return Util::CodepointToUtf8(Util::Utf8ToCodepoint(hiragana) +
                               kKatakanaOffset);
}

class TransitionTable {
 public:
  struct Position {
    size_t chain;
    size_t index;
  };

  TransitionTable() {
    for (const auto& hiragana_chain : kHiraganaChains) {
      std::vector<std::string> hiragana;
      std::vector<std::string> katakana;
      for (const absl::string_view kana : hiragana_chain) {
        if (kana.empty()) {
          break;
        }
        hiragana.emplace_back(kana);
        katakana.push_back(HiraganaToKatakana(kana));
      }
      AddChain(std::move(hiragana));
      AddChain(std::move(katakana));
    }
  }

  // Returns nullptr if `kana` is on no chain.
  const Position* Find(absl::string_view kana) const {
    const auto it = positions_.find(kana);
    return it == positions_.end() ? nullptr : &it->second;
  }

  absl::Span<const std::string> chain(size_t i) const { return chains_[i]; }

 private:
  void AddChain(std::vector<std::string> chain) {
    const size_t chain_id = chains_.size();
    for (size_t i = 0; i < chain.size(); ++i) {
      const bool inserted =
          positions_.emplace(chain[i], Position{chain_id, i}).second;
      DCHECK(inserted) << chain[i] << " is on more than one chain";
    }
    chains_.push_back(std::move(chain));
  }

  std::vector<std::vector<std::string>> chains_;
  absl::flat_hash_map<std::string, Position> positions_;
};

const TransitionTable& GetTransitionTable() {
  static const TransitionTable* const table = new TransitionTable();
  return *table;
}

// Returns the chain of `target` from its base form up to `target` itself.
std::vector<std::string> GetPathTo(absl::string_view target) {
  const TransitionTable& table = GetTransitionTable();
  const TransitionTable::Position* position = table.Find(target);
  if (position == nullptr) {
    return {std::string(target)};
  }
  const absl::Span<const std::string> chain = table.chain(position->chain);
  return std::vector<std::string>(chain.begin(),
                                  chain.begin() + position->index + 1);
}

}  // namespace

SequentialInputResult KanaTransitionValidator::Check(
    const absl::string_view partial_input,
    const absl::string_view target_char) const {
  SequentialInputResult result;
  if (target_char.empty()) {
    return result;
  }
  result.transformation_path = GetPathTo(target_char);

  if (partial_input == target_char) {
    result.is_valid = true;
    result.is_complete = true;
    result.confidence = 1.0;
    return result;
  }

  if (partial_input.empty()) {
    // Nothing typed yet is a prefix of every completion.
    result.is_valid = true;
    result.can_continue = true;
    result.next_possible_chars = result.transformation_path;
    result.hint = absl::StrJoin(result.transformation_path, "→");
    return result;
  }

  const TransitionTable& table = GetTransitionTable();
  const TransitionTable::Position* partial = table.Find(partial_input);
  const TransitionTable::Position* target = table.Find(target_char);
  if (partial == nullptr || target == nullptr ||
      partial->chain != target->chain || partial->index >= target->index) {
    return result;
  }

  result.is_valid = true;
  result.can_continue = true;
  result.confidence = static_cast<double>(partial->index + 1) /
                      static_cast<double>(target->index + 1);
  result.next_possible_chars.assign(
      result.transformation_path.begin() + partial->index + 1,
      result.transformation_path.end());
  result.hint = absl::StrJoin(result.transformation_path, "→");
  return result;
}

}  // namespace composer
}  // namespace tsuzuri
