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

#include "deepsan/sanitizer/mapping-table.h"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/name-classifier.h"
#include "re2/re2.h"

namespace deepsan {

static bool IsDecimal(absl::string_view text) {
  if (text.empty()) return false;
  for (const char c : text) {
    if (!absl::ascii_isdigit(c)) return false;
  }
  return true;
}

bool LooksLikeMaskedName(absl::string_view text) {
  const size_t underscore = text.rfind('_');
  if (underscore == absl::string_view::npos) return false;
  if (!IsDecimal(text.substr(underscore + 1))) return false;
  const absl::string_view prefix = text.substr(0, underscore);
  for (const NamingRule &rule : NamingRules()) {
    if (prefix == rule.prefix) return true;
  }
  for (const Category category : {Category::kVariable, Category::kFunction,
                                  Category::kClass, Category::kType}) {
    if (prefix == BasePrefix(category)) return true;
  }
  // CLASS is accepted as an alias of ENTITY.
  return prefix == "CLASS";
}

bool IsLiteralTag(absl::string_view text) {
  if (!absl::ConsumePrefix(&text, "[[") || !absl::ConsumeSuffix(&text, "]]")) {
    return false;
  }
  if (!absl::ConsumePrefix(&text, "STR_") &&
      !absl::ConsumePrefix(&text, "CMT_")) {
    return false;
  }
  return IsDecimal(text);
}

const char kWordPattern[] = R"([\w$\pL\pN]+)";

void MappingTable::MarkTaken(absl::string_view spelling) {
  taken_.emplace(spelling);
}

void MappingTable::MarkWordsTaken(absl::string_view text) {
  static const re2::RE2 kWord(absl::StrCat("(", kWordPattern, ")"));
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece word;
  while (re2::RE2::FindAndConsume(&input, kWord, &word)) {
    taken_.emplace(word.data(), word.size());
  }
}

std::string MappingTable::NextCandidate(absl::string_view prefix,
                                        int *counter) const {
  for (;;) {
    std::string candidate = absl::StrCat(prefix, "_", ++*counter);
    if (taken_.find(candidate) == taken_.end()) return candidate;
    VLOG(2) << "Skipping " << candidate << ", already in the source";
  }
}

absl::string_view MappingTable::GetOrCreate(absl::string_view original,
                                            Category category) {
  const std::string *existing = names_.find_forward(original);
  if (existing != nullptr) return *existing;

  const absl::string_view prefix = ClassifyName(original, category);
  int &counter = counters_[absl::AsciiStrToLower(prefix)];
  const auto inserted = names_.find_or_insert_generated(
      std::string(original),
      [this, prefix, &counter]() { return NextCandidate(prefix, &counter); });
  categories_.emplace(std::string(original), category);
  VLOG(2) << original << " (" << category << ") -> " << *inserted.first;
  return *inserted.first;
}

const std::string *MappingTable::FindMasked(absl::string_view original) const {
  return names_.find_forward(original);
}

const std::string *MappingTable::FindOriginal(absl::string_view masked) const {
  return names_.find_reverse(masked);
}

absl::string_view MappingTable::MintStringTag(absl::string_view literal_text) {
  const auto inserted = strings_.find_or_insert_generated(
      std::string(literal_text), [this]() {
        return absl::StrCat("[[", NextCandidate("STR", &string_tags_), "]]");
      });
  return *inserted.first;
}

absl::string_view MappingTable::MintCommentTag(absl::string_view content) {
  const auto inserted = comments_.find_or_insert_generated(
      std::string(content), [this]() {
        return absl::StrCat("[[", NextCandidate("CMT", &comment_tags_), "]]");
      });
  return *inserted.first;
}

Mapping MappingTable::ExportMapping() const {
  Mapping mapping;
  for (const StringBijection *bijection : {&names_, &strings_, &comments_}) {
    for (const auto &entry : bijection->reverse_view()) {
      mapping.emplace(entry.first, *entry.second);
    }
  }
  return mapping;
}

std::vector<MappingEntry> MappingTable::Entries() const {
  std::vector<MappingEntry> entries;
  entries.reserve(names_.size());
  for (const auto &entry : names_.forward_view()) {
    entries.push_back(
        {entry.first, *entry.second, categories_.find(entry.first)->second});
  }
  return entries;
}

void MappingTable::Reset() {
  names_.clear();
  categories_.clear();
  strings_.clear();
  comments_.clear();
  counters_.clear();
  string_tags_ = 0;
  comment_tags_ = 0;
  taken_.clear();
}

}  // namespace deepsan
