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

#ifndef DEEPSAN_SANITIZER_DEFINITION_COLLECTOR_H_
#define DEEPSAN_SANITIZER_DEFINITION_COLLECTOR_H_

#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/lang/syntax-tree.h"
#include "deepsan/lang/syntax-query.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "deepsan/sanitizer/sanitize-options.h"

namespace deepsan {

// A place where a name is introduced.
struct DefinitionOccurrence {
  absl::string_view text;  // Points into the source text.
  Category category;
  // Byte offsets [left, right) in the source text.
  int left;
  int right;
};

// Runs a definition query over "tree" and returns every captured site in
// source order.  A node captured by several patterns is reported once,
// with the category of the pattern that comes first in the query.  A capture name that isn't a
// definition category is an InvalidArgument error.
absl::StatusOr<std::vector<DefinitionOccurrence>> FindDefinitionSites(
    const SyntaxTree &tree, const SyntaxQuery &query);

// Returns true if a defined name may be masked: its category is enabled,
// it is at least options.min_name_length long, doesn't start with '_',
// isn't reserved, doesn't match options.keep_pattern, and doesn't already
// look like a masked name.
bool QualifiesForMasking(absl::string_view name, Category category,
                         const SanitizeOptions &options,
                         const ReservedSet &reserved);

// FindDefinitionSites(), keeping only qualifying names.
absl::StatusOr<std::vector<DefinitionOccurrence>> CollectDefinitions(
    const SyntaxTree &tree, const SyntaxQuery &query,
    const SanitizeOptions &options, const ReservedSet &reserved);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_DEFINITION_COLLECTOR_H_
