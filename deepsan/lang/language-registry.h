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

#ifndef DEEPSAN_LANG_LANGUAGE_REGISTRY_H_
#define DEEPSAN_LANG_LANGUAGE_REGISTRY_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/strings/compare.h"
#include "deepsan/lang/syntax-provider.h"

namespace deepsan {

using SyntaxProviderFactory =
    std::function<absl::StatusOr<std::unique_ptr<SyntaxProvider>>()>;

// Everything needed to find definitions in one language.
struct LanguageSupport {
  // Creates a fresh provider.  Failure means the parser could not be set up.
  SyntaxProviderFactory create_provider;

  // Tree-sitter query, for the provider's grammar, whose captures are
  // named def.var, def.func, def.class and def.type.
  std::string definition_query;
};

// Maps language ids (editor-style: "typescriptreact", "python", ...) to
// their LanguageSupport.
class LanguageRegistry {
 public:
  LanguageRegistry() = default;

  LanguageRegistry(const LanguageRegistry &) = delete;
  LanguageRegistry &operator=(const LanguageRegistry &) = delete;

  // The registry of built-in languages: javascript, javascriptreact,
  // typescript, typescriptreact and python.
  static const LanguageRegistry &Default();

  // Returns an error if the id is already taken.
  absl::Status Register(absl::string_view language_id,
                        LanguageSupport support);

  // Returns nullptr for unknown ids.
  const LanguageSupport *Find(absl::string_view language_id) const;

  // Registered ids, sorted.
  std::vector<absl::string_view> LanguageIds() const;

 private:
  std::map<std::string, LanguageSupport, StringViewCompare> languages_;
};

// Adds the built-in languages to "registry".
absl::Status RegisterBuiltinLanguages(LanguageRegistry *registry);

// Definition queries of the built-in languages.
extern const char kScriptDefinitionQuery[];
extern const char kPythonDefinitionQuery[];

// Guesses the language id from a file name's extension, e.g. "app.tsx" ->
// "typescriptreact".  Returns an empty string if unknown.
absl::string_view LanguageIdForFilename(absl::string_view filename);

}  // namespace deepsan

#endif  // DEEPSAN_LANG_LANGUAGE_REGISTRY_H_
