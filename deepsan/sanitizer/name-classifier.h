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

// Semantic prefixes for masked names.
//
// A masked name keeps a hint of what the original was for: "userList"
// becomes LIST_1, "isVisible" BOOL_1, "handleClick" HANDLER_1.  The hint is
// chosen by an ordered list of naming-convention rules; the first rule that
// matches wins, and names no rule matches get the base prefix of their
// category.

#ifndef DEEPSAN_SANITIZER_NAME_CLASSIFIER_H_
#define DEEPSAN_SANITIZER_NAME_CLASSIFIER_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "deepsan/sanitizer/category.h"

namespace deepsan {

// Splits an identifier into lowercase words at camelCase humps, acronym
// ends and underscores: "parseHTTPResponse_v2" -> parse, http, response,
// v2.  Digits stay with the word they follow.
std::vector<std::string> SplitNameWords(absl::string_view name);

// A name as seen by the naming rules.
struct NameWords {
  absl::string_view name;
  std::vector<std::string> words;  // See SplitNameWords().
};

struct NamingRule {
  absl::string_view prefix;
  absl::string_view description;
  bool (*matches)(const NameWords &);
};

// The naming-convention rules in priority order.
absl::Span<const NamingRule> NamingRules();

// Prefix for names that no rule matches: VAR, ACTION, ENTITY or TYPE.
absl::string_view BasePrefix(Category category);

// Returns the prefix for a masked name.  Deterministic and total.
absl::string_view ClassifyName(absl::string_view name, Category category);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_NAME_CLASSIFIER_H_
