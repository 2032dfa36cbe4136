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

#ifndef DEEPSAN_LANG_SYNTAX_PROVIDER_H_
#define DEEPSAN_LANG_SYNTAX_PROVIDER_H_

#include <tree_sitter/api.h>

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/lang/syntax-tree.h"

namespace deepsan {

// Produces syntax trees for one language.
class SyntaxProvider {
 public:
  virtual ~SyntaxProvider() = default;

  // The grammar trees are built with, for compiling queries against them.
  virtual const TSLanguage *language() const = 0;

  // Parses "text", which must outlive the returned tree.  Syntax errors
  // don't fail the parse; the tree holds ERROR nodes around them.
  virtual absl::StatusOr<std::unique_ptr<SyntaxTree>> Parse(
      absl::string_view text) = 0;
};

// A SyntaxProvider backed by a tree-sitter parser.
class TreeSitterProvider : public SyntaxProvider {
 public:
  // Fails if the grammar is null or its ABI version doesn't match the
  // linked tree-sitter runtime.
  static absl::StatusOr<std::unique_ptr<TreeSitterProvider>> Create(
      const TSLanguage *language);

  const TSLanguage *language() const final { return language_; }

  absl::StatusOr<std::unique_ptr<SyntaxTree>> Parse(
      absl::string_view text) final;

 private:
  struct ParserDeleter {
    void operator()(TSParser *parser) const { ts_parser_delete(parser); }
  };

  TreeSitterProvider(const TSLanguage *language, TSParser *parser)
      : language_(language), parser_(parser) {}

  const TSLanguage *const language_;
  std::unique_ptr<TSParser, ParserDeleter> parser_;
};

}  // namespace deepsan

#endif  // DEEPSAN_LANG_SYNTAX_PROVIDER_H_
