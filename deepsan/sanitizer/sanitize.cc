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

#include "deepsan/sanitizer/sanitize.h"

#include <tree_sitter/api.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/strings/comment-utils.h"
#include "deepsan/common/strings/quote-utils.h"
#include "deepsan/common/text/replacement-edit.h"
#include "deepsan/common/text/token-info.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/common/util/status-macros.h"
#include "deepsan/lang/language-registry.h"
#include "deepsan/lang/syntax-provider.h"
#include "deepsan/lang/syntax-query.h"
#include "deepsan/lang/syntax-tree.h"
#include "deepsan/sanitizer/definition-collector.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "deepsan/sanitizer/sanitize-options.h"

namespace deepsan {

static bool TypeIs(TSNode node, absl::string_view type) {
  return !ts_node_is_null(node) && ts_node_type(node) == type;
}

// Returns true if string literal "node" names a module: the source of an
// import or export, an ambient module name, or the argument of a loader
// call such as require() or import().
static bool IsModulePath(const SyntaxTree &tree, TSNode node) {
  static constexpr absl::string_view kModuleParents[] = {
      "import_statement", "export_statement", "import_require_clause",
      "module"};
  static constexpr absl::string_view kLoaders[] = {"require", "import",
                                                   "__import__"};
  const TSNode parent = ts_node_parent(node);
  for (const absl::string_view type : kModuleParents) {
    if (TypeIs(parent, type)) return true;
  }
  if (!TypeIs(parent, "arguments") && !TypeIs(parent, "argument_list")) {
    return false;
  }
  const TSNode call = ts_node_parent(parent);
  if (!TypeIs(call, "call_expression") && !TypeIs(call, "call")) return false;
  const TSNode callee = ts_node_child_by_field_name(call, "function", 8);
  if (ts_node_is_null(callee)) return false;
  const absl::string_view name = tree.NodeText(callee);
  for (const absl::string_view loader : kLoaders) {
    if (name == loader) return true;
  }
  return absl::EndsWith(name, "import_module");
}

// A "#!" line at the very start is not a comment to mask.
static bool IsInterpreterLine(const SyntaxTree &tree, TSNode comment) {
  return ts_node_start_byte(comment) == 0 &&
         absl::StartsWith(tree.NodeText(comment), "#!");
}

// Masks one string literal, unless it is empty or already a tag.
static void MaskStringLiteral(const TokenInfo &token, MappingTable *table,
                              EditSet *edits) {
  const QuotedParts parts = SplitQuoted(token.text());
  if (parts.head.empty() || parts.body.empty()) return;
  if (IsLiteralTag(parts.body)) return;
  const absl::string_view tag = table->MintStringTag(token.text());
  std::string replacement;
  if (parts.IsSimplyQuoted() &&
      parts.body.find('"') == absl::string_view::npos) {
    replacement = absl::StrCat("\"", tag, "\"");
  } else {
    replacement = absl::StrCat(parts.head, tag, parts.tail);
  }
  edits->Add(ReplacementEdit(token, std::move(replacement)));
}

// Masks the content of one comment, keeping its delimiters.
static void MaskComment(const TokenInfo &token, MappingTable *table,
                        EditSet *edits) {
  const CommentParts parts = SplitComment(token.text());
  if (parts.style == CommentStyle::kUnknown) return;
  if (StripCommentAndSpacePadding(token.text()).empty()) return;
  if (IsLiteralTag(parts.body)) return;
  const absl::string_view tag = table->MintCommentTag(parts.body);
  edits->Add(
      ReplacementEdit(token, absl::StrCat(parts.head, tag, parts.tail)));
}

// Does the masking; any error leaves "output" untouched.
static absl::Status SanitizeInto(absl::string_view code,
                                 const LanguageSupport &support,
                                 const SanitizeOptions &options,
                                 MappingTable *table, std::string *output) {
  auto provider = support.create_provider();
  if (!provider.ok()) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Parser initialization failed: ", provider.status().message()));
  }
  ASSIGN_OR_RETURN(
      const SyntaxQuery query,
      SyntaxQuery::Compile((*provider)->language(), support.definition_query));
  ASSIGN_OR_RETURN(const std::unique_ptr<SyntaxTree> tree,
                   (*provider)->Parse(code));

  const ReservedSet reserved(options.whitelist, options.whitelist_mode);
  ASSIGN_OR_RETURN(
      const std::vector<DefinitionOccurrence> definitions,
      CollectDefinitions(*tree, query, options, reserved));

  // Nothing minted may spell a word that stays in the output, wherever it
  // is, or tag-mode restoration would rewrite that word too.
  table->MarkWordsTaken(code);
  for (const DefinitionOccurrence &definition : definitions) {
    table->GetOrCreate(definition.text, definition.category);
  }

  EditSet edits;
  tree->Walk([&](TSNode node) {
    switch (ClassifyNode(node)) {
      case NodeKind::kIdentifier: {
        const std::string *masked = table->FindMasked(tree->NodeText(node));
        if (masked != nullptr) {
          edits.Add(ReplacementEdit(tree->NodeToken(node), *masked));
        }
        return false;
      }
      case NodeKind::kString:
        // Substitutions hold code; their literal parts stay as they are.
        if (HasSubstitutions(node)) return true;
        if (options.mask_strings && !IsModulePath(*tree, node)) {
          MaskStringLiteral(tree->NodeToken(node), table, &edits);
        }
        return false;
      case NodeKind::kComment:
        if (options.remove_comments && !IsInterpreterLine(*tree, node)) {
          MaskComment(tree->NodeToken(node), table, &edits);
        }
        return false;
      default:
        return true;
    }
  });

  VLOG(1) << "Masking " << table->name_count() << " names, "
          << table->string_count() << " strings, " << table->comment_count()
          << " comments with " << edits.size() << " edits";
  *output = edits.Apply(code);
  return absl::OkStatus();
}

SanitizeResult Sanitize(absl::string_view code, absl::string_view language_id,
                        const SanitizeOptions &options,
                        const LanguageRegistry &registry) {
  VLOG(1) << "Sanitize " << language_id << ", " << code.length() << " bytes";
  SanitizeResult result;
  const LanguageSupport *support = registry.Find(language_id);
  if (support == nullptr) {
    result.status = absl::UnimplementedError(
        absl::StrCat("Unsupported language \"", language_id, "\""));
  } else {
    MappingTable table;
    result.status =
        SanitizeInto(code, *support, options, &table, &result.sanitized);
    if (result.status.ok()) result.mapping = table.ExportMapping();
  }
  if (!result.status.ok()) {
    LOG(WARNING) << "Leaving code unmasked: " << result.status;
    result.sanitized = std::string(code);
  }
  return result;
}

SanitizeResult Sanitize(absl::string_view code, absl::string_view language_id,
                        const SanitizeOptions &options) {
  return Sanitize(code, language_id, options, LanguageRegistry::Default());
}

}  // namespace deepsan
