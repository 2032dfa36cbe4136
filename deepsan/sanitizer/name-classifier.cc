// Copyright 2026 The Deep Sanitizer Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "deepsan/sanitizer/name-classifier.h"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "deepsan/sanitizer/category.h"

namespace deepsan {

std::vector<std::string> SplitNameWords(absl::string_view name) {
  std::vector<std::string> words;
  std::string word;
  const auto flush = [&words, &word]() {
    if (!word.empty()) words.push_back(absl::AsciiStrToLower(word));
    word.clear();
  };
  for (size_t i = 0; i < name.length(); ++i) {
    const char c = name[i];
    if (!absl::ascii_isalnum(c)) {  // '_', '$', non-ASCII bytes
      flush();
      continue;
    }
    if (absl::ascii_isupper(c) && !word.empty()) {
      const char previous = name[i - 1];
      const bool next_is_lower =
          i + 1 < name.length() && absl::ascii_islower(name[i + 1]);
      // "userName" splits before 'N'; "HTTPResponse" splits before the 'R'
      // that starts a lowercase run.
      if (absl::ascii_islower(previous) || absl::ascii_isdigit(previous) ||
          (absl::ascii_isupper(previous) && next_is_lower)) {
        flush();
      }
    }
    word.push_back(c);
  }
  flush();
  return words;
}

static bool LastWordIsOneOf(const NameWords &name,
                            std::initializer_list<absl::string_view> set) {
  if (name.words.empty()) return false;
  for (const absl::string_view word : set) {
    if (name.words.back() == word) return true;
  }
  return false;
}

static bool FirstWordIsOneOf(const NameWords &name,
                             std::initializer_list<absl::string_view> set) {
  if (name.words.empty()) return false;
  for (const absl::string_view word : set) {
    if (name.words.front() == word) return true;
  }
  return false;
}

// Plural-looking English word.  Words ending in -ss, -us and -is are mostly
// singular, and so are the listed exceptions.
static bool IsPluralWord(absl::string_view word) {
  static constexpr absl::string_view kSingular[] = {
      "props",  "canvas", "series", "species", "news",  "lens",
      "gas",    "atlas",  "chaos",  "has",     "was",   "this",
      "does",   "always", "plus",   "yes",     "minus", "bonus",
      "alias",  "bias",   "status",
  };
  if (word.length() < 3 || !absl::EndsWith(word, "s")) return false;
  if (absl::EndsWith(word, "ss") || absl::EndsWith(word, "us") ||
      absl::EndsWith(word, "is")) {
    return false;
  }
  for (const absl::string_view singular : kSingular) {
    if (word == singular) return false;
  }
  return true;
}

static bool IsListLike(const NameWords &name) {
  if (LastWordIsOneOf(name, {"list", "array", "items", "collection"})) {
    return true;
  }
  return !name.words.empty() && IsPluralWord(name.words.back());
}

static bool IsBooleanStyle(const NameWords &name) {
  return name.words.size() >= 2 &&
         FirstWordIsOneOf(name, {"is", "has", "can", "should", "did", "will"});
}

static bool IsStringLike(const NameWords &name) {
  return name.words.size() >= 2 &&
         LastWordIsOneOf(name, {"name", "title", "text", "str", "label",
                                "message", "msg"});
}

static bool IsNumericStyle(const NameWords &name) {
  return name.words.size() >= 2 &&
         LastWordIsOneOf(name, {"count", "index", "num", "size", "length",
                                "amount", "price", "total"});
}

static bool IsIdLike(const NameWords &name) {
  return name.words.size() >= 2 &&
         LastWordIsOneOf(name, {"id", "key", "code", "uuid"});
}

static bool IsHandlerStyle(const NameWords &name) {
  return name.words.size() >= 2 && FirstWordIsOneOf(name, {"on", "handle"});
}

static bool IsHookStyle(const NameWords &name) {
  return name.words.size() >= 2 && FirstWordIsOneOf(name, {"use"});
}

static bool IsPropsDefinition(const NameWords &name) {
  return name.words.size() >= 2 && LastWordIsOneOf(name, {"props"});
}

static bool IsProps(const NameWords &name) { return name.name == "props"; }

absl::Span<const NamingRule> NamingRules() {
  static constexpr NamingRule kRules[] = {
      {"LIST", "plural, or ends in List/Array/Items/Collection", IsListLike},
      {"BOOL", "starts with is/has/can/should/did/will", IsBooleanStyle},
      {"STR", "ends in Name/Title/Text/Str/Label/Message/Msg", IsStringLike},
      {"NUM", "ends in Count/Index/Num/Size/Length/Amount/Price/Total",
       IsNumericStyle},
      {"ID", "ends in Id/Key/Code/Uuid", IsIdLike},
      {"HANDLER", "starts with on/handle", IsHandlerStyle},
      {"HOOK", "starts with use", IsHookStyle},
      {"PROPS_DEF", "ends in Props", IsPropsDefinition},
      {"PROPS", "is exactly props", IsProps},
  };
  return kRules;
}

absl::string_view BasePrefix(Category category) {
  switch (category) {
    case Category::kVariable:
      return "VAR";
    case Category::kFunction:
      return "ACTION";
    case Category::kClass:
      return "ENTITY";
    case Category::kType:
      return "TYPE";
  }
  return "VAR";
}

absl::string_view ClassifyName(absl::string_view name, Category category) {
  const NameWords words{name, SplitNameWords(name)};
  for (const NamingRule &rule : NamingRules()) {
    if (rule.matches(words)) return rule.prefix;
  }
  return BasePrefix(category);
}

}  // namespace deepsan
