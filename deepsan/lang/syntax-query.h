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

#ifndef DEEPSAN_LANG_SYNTAX_QUERY_H_
#define DEEPSAN_LANG_SYNTAX_QUERY_H_

#include <tree_sitter/api.h>

#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/lang/syntax-tree.h"

namespace deepsan {

struct QueryCapture {
  absl::string_view name;  // Points into the owning SyntaxQuery.
  TSNode node;
};

struct QueryMatch {
  int pattern_index;
  std::vector<QueryCapture> captures;
};

// A compiled tree-sitter query, e.g.
//   (function_declaration name: (identifier) @def.func)
// Predicates such as #eq? are not evaluated, so they are rejected.
class SyntaxQuery {
 public:
  // Compiles "source" for "language".  Malformed source yields
  // InvalidArgument naming the kind of error and its byte offset.
  static absl::StatusOr<SyntaxQuery> Compile(const TSLanguage *language,
                                             absl::string_view source);

  SyntaxQuery(SyntaxQuery &&) = default;
  SyntaxQuery &operator=(SyntaxQuery &&) = default;

  int pattern_count() const;

  // All matches of all patterns in "tree", in the order tree-sitter
  // reports them.
  std::vector<QueryMatch> Matches(const SyntaxTree &tree) const;

 private:
  struct QueryDeleter {
    void operator()(TSQuery *query) const { ts_query_delete(query); }
  };

  explicit SyntaxQuery(TSQuery *query) : query_(query) {}

  std::unique_ptr<TSQuery, QueryDeleter> query_;
};

}  // namespace deepsan

#endif  // DEEPSAN_LANG_SYNTAX_QUERY_H_
