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

#include "deepsan/lang/syntax-query.h"

#include <tree_sitter/api.h>

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/lang/syntax-tree.h"

namespace deepsan {

static absl::string_view QueryErrorName(TSQueryError error) {
  switch (error) {
    case TSQueryErrorSyntax:
      return "syntax";
    case TSQueryErrorNodeType:
      return "unknown node type";
    case TSQueryErrorField:
      return "unknown field";
    case TSQueryErrorCapture:
      return "unknown capture";
    case TSQueryErrorStructure:
      return "impossible pattern";
    case TSQueryErrorLanguage:
      return "language";
    default:
      return "query";
  }
}

absl::StatusOr<SyntaxQuery> SyntaxQuery::Compile(const TSLanguage *language,
                                                 absl::string_view source) {
  uint32_t error_offset = 0;
  TSQueryError error_type = TSQueryErrorNone;
  TSQuery *query = ts_query_new(language, source.data(),
                                static_cast<uint32_t>(source.size()),
                                &error_offset, &error_type);
  if (query == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Query ", QueryErrorName(error_type), " error at offset ",
                     error_offset, ": \"", source.substr(error_offset, 24),
                     "\""));
  }
  SyntaxQuery compiled(query);
  for (uint32_t i = 0; i < ts_query_pattern_count(query); ++i) {
    uint32_t steps = 0;
    ts_query_predicates_for_pattern(query, i, &steps);
    if (steps > 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Query predicates are not supported, in pattern ", i,
          " at offset ", ts_query_start_byte_for_pattern(query, i)));
    }
  }
  return compiled;
}

int SyntaxQuery::pattern_count() const {
  return static_cast<int>(ts_query_pattern_count(query_.get()));
}

std::vector<QueryMatch> SyntaxQuery::Matches(const SyntaxTree &tree) const {
  std::vector<QueryMatch> result;
  TSQueryCursor *cursor = ts_query_cursor_new();
  ts_query_cursor_exec(cursor, query_.get(), tree.root());
  TSQueryMatch match;
  while (ts_query_cursor_next_match(cursor, &match)) {
    QueryMatch &added = result.emplace_back();
    added.pattern_index = match.pattern_index;
    for (uint16_t i = 0; i < match.capture_count; ++i) {
      uint32_t length = 0;
      const char *name = ts_query_capture_name_for_id(
          query_.get(), match.captures[i].index, &length);
      added.captures.push_back(
          {absl::string_view(name, length), match.captures[i].node});
    }
  }
  ts_query_cursor_delete(cursor);
  VLOG(2) << "Query found " << result.size() << " matches";
  return result;
}

}  // namespace deepsan
