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

#include "deepsan/lang/syntax-provider.h"

#include <tree_sitter/api.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <ostream>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/text/token-info.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/lang/syntax-tree.h"

namespace deepsan {

absl::StatusOr<std::unique_ptr<TreeSitterProvider>> TreeSitterProvider::Create(
    const TSLanguage *language) {
  if (language == nullptr) {
    return absl::FailedPreconditionError("No grammar");
  }
  TSParser *parser = ts_parser_new();
  if (!ts_parser_set_language(parser, language)) {
    ts_parser_delete(parser);
    return absl::FailedPreconditionError(absl::StrCat(
        "Grammar ABI version ", ts_language_version(language),
        " is incompatible with the tree-sitter runtime"));
  }
  return std::unique_ptr<TreeSitterProvider>(
      new TreeSitterProvider(language, parser));
}

absl::StatusOr<std::unique_ptr<SyntaxTree>> TreeSitterProvider::Parse(
    absl::string_view text) {
  if (text.size() > std::numeric_limits<uint32_t>::max()) {
    return absl::OutOfRangeError(
        absl::StrCat("Input of ", text.size(), " bytes is too large"));
  }
  TSTree *parsed = ts_parser_parse_string(
      parser_.get(), nullptr, text.data(), static_cast<uint32_t>(text.size()));
  if (parsed == nullptr) {
    return absl::InternalError("Parser returned no tree");
  }
  auto tree = std::make_unique<SyntaxTree>(text, parsed);
  if (tree->HasErrors()) {
    int errors = 0;
    tree->Walk([&tree, &errors](TSNode node) {
      if (!ts_node_is_error(node) && !ts_node_is_missing(node)) return true;
      ++errors;
      const SyntaxTree &t = *tree;
      VLOG(2) << "Syntax error: "
              << TokenWithContext{t.NodeToken(node),
                                  {t.text(), [&t](std::ostream &s, int e) {
                                     t.PrintSymbol(s, e);
                                   }}};
      return false;
    });
    VLOG(1) << "Recovered from " << errors << " syntax errors";
  }
  return tree;
}

}  // namespace deepsan
