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

#include "deepsan/sanitizer/definition-collector.h"

#include <tree_sitter/api.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/lang/syntax-tree.h"
#include "deepsan/lang/syntax-query.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "deepsan/sanitizer/sanitize-options.h"
#include "re2/re2.h"

namespace deepsan {

absl::StatusOr<std::vector<DefinitionOccurrence>> FindDefinitionSites(
    const SyntaxTree &tree, const SyntaxQuery &query) {
  struct Site {
    int pattern_index;
    Category category;
    TSNode node;
  };
  // start byte -> site of the earliest pattern
  std::map<uint32_t, Site> sites;
  for (const QueryMatch &match : query.Matches(tree)) {
    for (const QueryCapture &capture : match.captures) {
      const auto category = CategoryFromCaptureName(capture.name);
      if (!category.ok()) return category.status();
      const Site site{match.pattern_index, *category, capture.node};
      const auto inserted =
          sites.emplace(ts_node_start_byte(capture.node), site);
      if (!inserted.second &&
          match.pattern_index < inserted.first->second.pattern_index) {
        inserted.first->second = site;
      }
    }
  }

  std::vector<DefinitionOccurrence> result;
  result.reserve(sites.size());
  for (const auto &entry : sites) {
    const TSNode node = entry.second.node;
    result.push_back({tree.NodeText(node), entry.second.category,
                      static_cast<int>(ts_node_start_byte(node)),
                      static_cast<int>(ts_node_end_byte(node))});
  }
  VLOG(1) << "Found " << result.size() << " definition sites";
  return result;
}

bool QualifiesForMasking(absl::string_view name, Category category,
                         const SanitizeOptions &options,
                         const ReservedSet &reserved) {
  if (!options.CategoryEnabled(category)) return false;
  if (static_cast<int>(name.length()) < options.min_name_length) return false;
  if (absl::StartsWith(name, "_")) return false;
  if (reserved.Contains(name)) return false;
  if (options.keep_pattern != nullptr &&
      re2::RE2::PartialMatch(re2::StringPiece(name.data(), name.size()),
                        *options.keep_pattern)) {
    return false;
  }
  // Output of an earlier run stays as it is.
  return !LooksLikeMaskedName(name);
}

absl::StatusOr<std::vector<DefinitionOccurrence>> CollectDefinitions(
    const SyntaxTree &tree, const SyntaxQuery &query,
    const SanitizeOptions &options, const ReservedSet &reserved) {
  auto sites = FindDefinitionSites(tree, query);
  if (!sites.ok()) return sites.status();
  std::vector<DefinitionOccurrence> &definitions = *sites;
  definitions.erase(
      std::remove_if(definitions.begin(), definitions.end(),
                     [&options, &reserved](const DefinitionOccurrence &d) {
                       const bool keep = QualifiesForMasking(
                           d.text, d.category, options, reserved);
                       if (!keep) VLOG(2) << "Not masking " << d.text;
                       return !keep;
                     }),
      definitions.end());
  return sites;
}

}  // namespace deepsan
