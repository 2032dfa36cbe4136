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

#include "deepsan/lang/language-registry.h"

#include <tree_sitter/api.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/file-util.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/common/util/status-macros.h"
#include "deepsan/lang/grammars.h"
#include "deepsan/lang/syntax-provider.h"

namespace deepsan {

const char kScriptDefinitionQuery[] = R"(
; Functions, methods and classes
(function_declaration name: (identifier) @def.func)
(generator_function_declaration name: (identifier) @def.func)
(function_expression name: (identifier) @def.func)
(method_definition name: (property_identifier) @def.func)
(class_declaration name: (type_identifier) @def.class)
(abstract_class_declaration name: (type_identifier) @def.class)
(class name: (type_identifier) @def.class)

; Types
(interface_declaration name: (type_identifier) @def.type)
(type_alias_declaration name: (type_identifier) @def.type)
(enum_declaration name: (identifier) @def.type)

; Variables and parameters, skipping destructuring patterns
(variable_declarator name: (identifier) @def.var)
(required_parameter pattern: (identifier) @def.var)
(optional_parameter pattern: (identifier) @def.var)
(arrow_function parameter: (identifier) @def.var)
)";

const char kPythonDefinitionQuery[] = R"(
(function_definition name: (identifier) @def.func)
(class_definition name: (identifier) @def.class)

(parameters (identifier) @def.var)
(parameters (typed_parameter (identifier) @def.var))
(parameters (default_parameter name: (identifier) @def.var))
(parameters (typed_default_parameter name: (identifier) @def.var))

(assignment left: (identifier) @def.var)
(for_statement left: (identifier) @def.var)
)";

static SyntaxProviderFactory GrammarProviderFactory(
    const TSLanguage *(*grammar)()) {
  return [grammar]() -> absl::StatusOr<std::unique_ptr<SyntaxProvider>> {
    auto provider = TreeSitterProvider::Create(grammar());
    if (!provider.ok()) return provider.status();
    return std::unique_ptr<SyntaxProvider>(std::move(*provider));
  };
}

absl::Status RegisterBuiltinLanguages(LanguageRegistry *registry) {
  // Plain typescript has no JSX: "<T>value" is a type assertion there.
  const struct {
    absl::string_view id;
    const TSLanguage *(*grammar)();
  } kScriptLanguages[] = {
      {"javascript", tree_sitter_tsx},
      {"javascriptreact", tree_sitter_tsx},
      {"typescript", tree_sitter_typescript},
      {"typescriptreact", tree_sitter_tsx},
  };
  for (const auto &language : kScriptLanguages) {
    RETURN_IF_ERROR(registry->Register(
        language.id,
        {GrammarProviderFactory(language.grammar), kScriptDefinitionQuery}));
  }
  return registry->Register(
      "python",
      {GrammarProviderFactory(tree_sitter_python), kPythonDefinitionQuery});
}

const LanguageRegistry &LanguageRegistry::Default() {
  static const LanguageRegistry *const registry = [] {
    auto *r = new LanguageRegistry;
    const absl::Status status = RegisterBuiltinLanguages(r);
    CHECK(status.ok()) << status.message();
    return r;
  }();
  return *registry;
}

absl::Status LanguageRegistry::Register(absl::string_view language_id,
                                        LanguageSupport support) {
  if (!support.create_provider) {
    return absl::InvalidArgumentError(
        absl::StrCat(language_id, ": missing syntax provider factory"));
  }
  const auto inserted =
      languages_.emplace(std::string(language_id), std::move(support));
  if (!inserted.second) {
    return absl::AlreadyExistsError(
        absl::StrCat("Language \"", language_id, "\" is already registered."));
  }
  return absl::OkStatus();
}

const LanguageSupport *LanguageRegistry::Find(
    absl::string_view language_id) const {
  const auto found = languages_.find(language_id);
  return found == languages_.end() ? nullptr : &found->second;
}

std::vector<absl::string_view> LanguageRegistry::LanguageIds() const {
  std::vector<absl::string_view> ids;
  ids.reserve(languages_.size());
  for (const auto &language : languages_) ids.emplace_back(language.first);
  return ids;
}

absl::string_view LanguageIdForFilename(absl::string_view filename) {
  static constexpr struct {
    absl::string_view extension;
    absl::string_view language_id;
  } kExtensions[] = {
      {".js", "javascript"},       {".mjs", "javascript"},
      {".cjs", "javascript"},      {".jsx", "javascriptreact"},
      {".ts", "typescript"},       {".mts", "typescript"},
      {".cts", "typescript"},      {".tsx", "typescriptreact"},
      {".py", "python"},           {".pyi", "python"},
  };
  const std::string extension =
      absl::AsciiStrToLower(file::Extension(filename));
  for (const auto &entry : kExtensions) {
    if (extension == entry.extension) return entry.language_id;
  }
  return "";
}

}  // namespace deepsan
