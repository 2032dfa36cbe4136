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

// Request-scoped store of the masked names and placeholder tags minted
// during one sanitize call.

#ifndef DEEPSAN_SANITIZER_MAPPING_TABLE_H_
#define DEEPSAN_SANITIZER_MAPPING_TABLE_H_

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "deepsan/common/strings/compare.h"
#include "deepsan/common/util/bijective-map.h"
#include "deepsan/sanitizer/category.h"

namespace deepsan {

// Externally visible mapping: masked name or literal tag -> original text.
// Ordered, so its serializations are deterministic.
using Mapping = std::map<std::string, std::string, StringViewCompare>;

struct MappingEntry {
  std::string original;
  std::string masked;
  Category category;
};

// True for names of the shape this engine mints for identifiers: a known
// prefix, '_' and a decimal counter, like VAR_3 or PROPS_DEF_12.
bool LooksLikeMaskedName(absl::string_view text);

// True for "[[STR_<n>]]" and "[[CMT_<n>]]".
bool IsLiteralTag(absl::string_view text);

// RE2 pattern of one word: a maximal run of letters, digits, '_' and '$'.
// Tag-mode restoration replaces whole words only.
extern const char kWordPattern[];

// Bidirectional original <-> masked store with per-prefix counters.
//
// Masked names are "<PREFIX>_<n>" with the prefix from ClassifyName() and n
// counting up per prefix from 1.  String literals and comments get
// "[[STR_<n>]]" and "[[CMT_<n>]]" tags with counters of their own.
// A candidate that is already in use, or that was declared taken, is
// skipped, so nothing minted can collide with another masked name or with
// text that stays in the output.
class MappingTable {
 public:
  MappingTable() = default;

  MappingTable(const MappingTable &) = delete;
  MappingTable &operator=(const MappingTable &) = delete;

  // Declares a spelling that masked names and tags must never take, such as
  // an identifier that stays unmasked.
  void MarkTaken(absl::string_view spelling);

  // MarkTaken() for every word of "text", wherever it appears: code,
  // comments and string literals alike.
  void MarkWordsTaken(absl::string_view text);

  // Returns the masked name of "original", creating it on first use.
  // Later calls return the first result, whatever their category.
  absl::string_view GetOrCreate(absl::string_view original, Category category);

  // Returns the masked name of "original", or nullptr.
  const std::string *FindMasked(absl::string_view original) const;

  // Returns the original of masked name "masked", or nullptr.
  const std::string *FindOriginal(absl::string_view masked) const;

  // Returns the tag for a string literal (quotes included), minting it on
  // first use.
  absl::string_view MintStringTag(absl::string_view literal_text);

  // Returns the tag for a comment's content.  Equal contents share a tag.
  absl::string_view MintCommentTag(absl::string_view content);

  // Masked names and tags with their originals.
  Mapping ExportMapping() const;

  // Name entries, ordered by original.
  std::vector<MappingEntry> Entries() const;

  size_t name_count() const { return names_.size(); }
  size_t string_count() const { return strings_.size(); }
  size_t comment_count() const { return comments_.size(); }

  // Forgets everything, including taken spellings and counters.
  void Reset();

 private:
  using StringBijection = BijectiveMap<std::string, std::string,
                                       StringViewCompare, StringViewCompare>;

  // Returns "<prefix>_<n>" for the next n whose result is not taken.
  std::string NextCandidate(absl::string_view prefix, int *counter) const;

  // original -> masked name
  StringBijection names_;
  std::map<std::string, Category, StringViewCompare> categories_;

  // literal text -> "[[STR_n]]"
  StringBijection strings_;

  // comment content -> "[[CMT_n]]"
  StringBijection comments_;

  // Keyed by lowercase prefix.
  std::map<std::string, int> counters_;
  int string_tags_ = 0;
  int comment_tags_ = 0;

  std::set<std::string, StringViewCompare> taken_;
};

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_MAPPING_TABLE_H_
