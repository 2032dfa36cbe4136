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

#ifndef DEEPSAN_LANG_SYNTAX_TREE_H_
#define DEEPSAN_LANG_SYNTAX_TREE_H_

#include <tree_sitter/api.h>

#include <functional>
#include <iosfwd>
#include <memory>

#include "absl/strings/string_view.h"
#include "deepsan/common/text/token-info.h"

namespace deepsan {

// How the sanitizer treats a node.
enum class NodeKind {
  kOther,
  kIdentifier,  // Any name: variables, properties, types, labels.
  kString,      // A whole string literal, quotes included.
  kComment,
};

// Classifies by node type name, which the supported grammars share.
NodeKind ClassifyNode(TSNode node);

// True for a string or template literal with ${...} or {...} parts.
bool HasSubstitutions(TSNode string_node);

// A parsed source text.  Owns the tree-sitter tree; the text must outlive
// it.
class SyntaxTree {
 public:
  SyntaxTree(absl::string_view text, TSTree *tree);

  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree &operator=(const SyntaxTree &) = delete;

  absl::string_view text() const { return text_; }
  TSNode root() const;
  const TSLanguage *language() const;

  // The source text a node spans.
  absl::string_view NodeText(TSNode node) const;

  // A token over the node's text, enumerated by the node's grammar symbol.
  TokenInfo NodeToken(TSNode node) const;

  // True if the parser had to recover from a syntax error anywhere.
  bool HasErrors() const;

  // Visits every node in pre-order.  Returning false from "visit" skips
  // the node's children.
  void Walk(const std::function<bool(TSNode)> &visit) const;

  // Prints the grammar's name for a symbol, for TokenInfo::Context.
  void PrintSymbol(std::ostream &stream, int symbol) const;

 private:
  struct TreeDeleter {
    void operator()(TSTree *tree) const { ts_tree_delete(tree); }
  };

  absl::string_view text_;
  std::unique_ptr<TSTree, TreeDeleter> tree_;
};

}  // namespace deepsan

#endif  // DEEPSAN_LANG_SYNTAX_TREE_H_
