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

#ifndef DEEPSAN_SANITIZER_SANITIZE_H_
#define DEEPSAN_SANITIZER_SANITIZE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "deepsan/lang/language-registry.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "deepsan/sanitizer/sanitize-options.h"

namespace deepsan {

struct SanitizeResult {
  std::string sanitized;

  // Masked name or literal tag -> original text.
  Mapping mapping;

  // Not ok if masking was skipped, in which case "sanitized" is the input
  // unchanged and "mapping" is empty.  Codes:
  //   kUnimplemented       unsupported language
  //   kFailedPrecondition  the parser could not be set up
  //   kInvalidArgument     the language's definition query is malformed
  absl::Status status;
};

// Masks the names defined in "code", and optionally its string literals
// and comments.
//
// Every identifier whose spelling is a qualifying definition anywhere in
// the file is renamed, wherever it occurs; there is no scoping.  Names that
// are never defined in the file (imports, globals, library members) are
// left alone.  Each call uses a fresh MappingTable.
//
// Never fails: problems leave the code unmasked, see SanitizeResult::status.
SanitizeResult Sanitize(absl::string_view code, absl::string_view language_id,
                        const SanitizeOptions &options,
                        const LanguageRegistry &registry);

// Sanitize() with LanguageRegistry::Default().
SanitizeResult Sanitize(absl::string_view code, absl::string_view language_id,
                        const SanitizeOptions &options);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_SANITIZE_H_
