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

#ifndef DEEPSAN_SANITIZER_RESTORE_H_
#define DEEPSAN_SANITIZER_RESTORE_H_

#include <iosfwd>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/lang/language-registry.h"
#include "deepsan/sanitizer/mapping-table.h"

namespace deepsan {

enum class RestoreMode {
  // Text scan for tags and whole-word masked names.  Works on text that was
  // reformatted or partly rewritten.
  kTag,
  // Re-lexes the text and only touches identifiers, string literals and
  // comments.
  kStructural,
};

std::ostream &operator<<(std::ostream &stream, RestoreMode mode);

bool AbslParseFlag(absl::string_view text, RestoreMode *mode,
                   std::string *error);
std::string AbslUnparseFlag(const RestoreMode &mode);

// Tag-mode restoration of "masked".
//
// "[[STR_n]]" becomes the inner content of the stored literal, so whatever
// quotes surround the tag are kept.  "[[CMT_n]]" becomes the stored comment
// content.  Other words that are keys of "mapping" become their original.
// Unknown tags and names are kept, and replaced text is never rescanned.
std::string RestoreTags(absl::string_view masked, const Mapping &mapping);

// Structural restoration of "masked" written in "language_id".  Fails if the
// language is not in "registry" or its parser cannot be set up.
absl::StatusOr<std::string> RestoreStructurally(
    absl::string_view masked, const Mapping &mapping,
    absl::string_view language_id, const LanguageRegistry &registry);

// Restores "masked" in the given mode.  Structural mode falls back to tag
// mode, with a warning, when it is not available for the language.
std::string Restore(absl::string_view masked, const Mapping &mapping,
                    absl::string_view language_id, RestoreMode mode,
                    const LanguageRegistry &registry);
std::string Restore(absl::string_view masked, const Mapping &mapping,
                    absl::string_view language_id,
                    RestoreMode mode = RestoreMode::kTag);

// Restore() with the mapping in its JSON form.  A malformed mapping is
// InvalidArgument.
absl::StatusOr<std::string> RestoreWithMap(
    absl::string_view masked, absl::string_view mapping_json,
    absl::string_view language_id, RestoreMode mode = RestoreMode::kTag);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_RESTORE_H_
