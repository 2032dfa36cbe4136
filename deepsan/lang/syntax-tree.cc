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

#include "deepsan/lang/syntax-tree.h"

#include <tree_sitter/api.h>

#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>

#include "absl/strings/string_view.h"
#include "deepsan/common/text/token-info.h"

namespace deepsan {

static bool TypeIs(TSNode node, const char *type) {
  return std::strcmp(ts_node_type(node), type) == 0;
}

NodeKind ClassifyNode(TSNode node) {
  static constexpr const char *kIdentifierTypes[] = {
      "identifier",
      "property_identifier",
      "private_property_identifier",
      "type_identifier",
      "shorthand_property_identifier",
      "shorthand_property_identifier_pattern",
      "statement_identifier",
  };
  if (!ts_node_is_named(node)) return NodeKind::kOther;
  for (const char *type : kIdentifierTypes) {
    if (TypeIs(node, type)) return NodeKind::kIdentifier;
  }
  if (TypeIs(node, "string") || TypeIs(node, "template_string")) {
    return NodeKind::kString;
  }
  if (TypeIs(node, "comment")) return NodeKind::kComment;
  return NodeKind::kOther;
}

bool HasSubstitutions(TSNode string_node) {
  const uint32_t count = ts_node_named_child_count(string_node);
  for (uint32_t i = 0; i < count; ++i) {
    const TSNode child = ts_node_named_child(string_node, i);
    if (TypeIs(child, "template_substitution") ||
        TypeIs(child, "interpolation")) {
      return true;
    }
  }
  return false;
}

SyntaxTree::SyntaxTree(absl::string_view text, TSTree *tree)
    : text_(text), tree_(tree) {}

TSNode SyntaxTree::root() const { return ts_tree_root_node(tree_.get()); }

const TSLanguage *SyntaxTree::language() const {
  return ts_tree_language(tree_.get());
}

absl::string_view SyntaxTree::NodeText(TSNode node) const {
  const uint32_t start = ts_node_start_byte(node);
  const uint32_t end = ts_node_end_byte(node);
  return text_.substr(start, end - start);
}

TokenInfo SyntaxTree::NodeToken(TSNode node) const {
  return TokenInfo(ts_node_symbol(node), NodeText(node));
}

bool SyntaxTree::HasErrors() const { return ts_node_has_error(root()); }

namespace {
// Frees the cursor on scope exit.
class ScopedCursor {
 public:
  explicit ScopedCursor(TSNode node) : cursor_(ts_tree_cursor_new(node)) {}
  ~ScopedCursor() { ts_tree_cursor_delete(&cursor_); }

  ScopedCursor(const ScopedCursor &) = delete;
  ScopedCursor &operator=(const ScopedCursor &) = delete;

  TSTreeCursor *get() { return &cursor_; }

 private:
  TSTreeCursor cursor_;
};
}  // namespace

void SyntaxTree::Walk(const std::function<bool(TSNode)> &visit) const {
  ScopedCursor scoped(root());
  TSTreeCursor *cursor = scoped.get();
  for (;;) {
    const bool descend = visit(ts_tree_cursor_current_node(cursor));
    if (descend && ts_tree_cursor_goto_first_child(cursor)) continue;
    while (!ts_tree_cursor_goto_next_sibling(cursor)) {
      if (!ts_tree_cursor_goto_parent(cursor)) return;
    }
  }
}

void SyntaxTree::PrintSymbol(std::ostream &stream, int symbol) const {
  const char *name =
      ts_language_symbol_name(language(), static_cast<TSSymbol>(symbol));
  stream << (name != nullptr ? name : "???");
}

}  // namespace deepsan
