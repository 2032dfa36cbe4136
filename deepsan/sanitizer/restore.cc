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

#include "deepsan/sanitizer/restore.h"

#include <tree_sitter/api.h>

#include <memory>
#include <ostream>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/strings/comment-utils.h"
#include "deepsan/common/strings/quote-utils.h"
#include "deepsan/common/text/replacement-edit.h"
#include "deepsan/common/util/enum-flags.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/common/util/status-macros.h"
#include "deepsan/lang/language-registry.h"
#include "deepsan/lang/syntax-provider.h"
#include "deepsan/lang/syntax-tree.h"
#include "deepsan/sanitizer/mapping-json.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "re2/re2.h"

namespace deepsan {

static const EnumNameMap<RestoreMode> &RestoreModeNames() {
  static const EnumNameMap<RestoreMode> kNames({
      {"tag", RestoreMode::kTag},
      {"structural", RestoreMode::kStructural},
  });
  return kNames;
}

std::ostream &operator<<(std::ostream &stream, RestoreMode mode) {
  return RestoreModeNames().Unparse(mode, stream);
}

bool AbslParseFlag(absl::string_view text, RestoreMode *mode,
                   std::string *error) {
  return RestoreModeNames().Parse(text, mode, error, "restore mode");
}

std::string AbslUnparseFlag(const RestoreMode &mode) {
  std::ostringstream stream;
  stream << mode;
  return stream.str();
}

// Returns what "key" stands for in restored text, or nullptr if it is not
// in the mapping.
static const std::string *LookupOriginal(const Mapping &mapping,
                                         absl::string_view key,
                                         std::string *scratch) {
  const auto found = mapping.find(key);
  if (found == mapping.end()) return nullptr;
  if (absl::StartsWith(key, "[[STR_")) {
    *scratch = std::string(SplitQuoted(found->second).body);
    return scratch;
  }
  return &found->second;
}

std::string RestoreTags(absl::string_view masked, const Mapping &mapping) {
  // Tags are tried first wherever a '[' starts; everything else is cut into
  // whole words.
  static const re2::RE2 kPattern(
      absl::StrCat(R"((\[\[(?:STR|CMT)_\d+\]\]|)", kWordPattern, ")"));
  std::string restored;
  restored.reserve(masked.length());
  re2::StringPiece input(masked.data(), masked.size());
  re2::StringPiece match;
  const char *copied = masked.data();
  int replaced = 0;
  std::string scratch;
  while (re2::RE2::FindAndConsume(&input, kPattern, &match)) {
    const absl::string_view word(match.data(), match.size());
    const std::string *original = LookupOriginal(mapping, word, &scratch);
    if (original == nullptr) continue;
    restored.append(copied, word.data());
    restored.append(*original);
    copied = word.data() + word.size();
    ++replaced;
  }
  restored.append(copied, masked.data() + masked.size());
  VLOG(1) << "Tag restore replaced " << replaced << " occurrences";
  return restored;
}

// Adds an edit replacing "fragment" by its original, if it has one.
static void RestoreFragment(absl::string_view fragment, const Mapping &mapping,
                            EditSet *edits) {
  std::string scratch;
  const std::string *original = LookupOriginal(mapping, fragment, &scratch);
  if (original != nullptr) edits->Add(ReplacementEdit(fragment, *original));
}

absl::StatusOr<std::string> RestoreStructurally(
    absl::string_view masked, const Mapping &mapping,
    absl::string_view language_id, const LanguageRegistry &registry) {
  const LanguageSupport *support = registry.Find(language_id);
  if (support == nullptr) {
    return absl::UnimplementedError(
        absl::StrCat("Unsupported language \"", language_id, "\""));
  }
  auto provider = support->create_provider();
  if (!provider.ok()) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Parser initialization failed: ", provider.status().message()));
  }
  ASSIGN_OR_RETURN(const std::unique_ptr<SyntaxTree> tree,
                   (*provider)->Parse(masked));

  EditSet edits;
  tree->Walk([&](TSNode node) {
    switch (ClassifyNode(node)) {
      case NodeKind::kIdentifier:
        RestoreFragment(tree->NodeText(node), mapping, &edits);
        return false;
      case NodeKind::kString: {
        if (HasSubstitutions(node)) return true;
        const absl::string_view body = SplitQuoted(tree->NodeText(node)).body;
        if (absl::StartsWith(body, "[[STR_") && IsLiteralTag(body)) {
          RestoreFragment(body, mapping, &edits);
        }
        return false;
      }
      case NodeKind::kComment: {
        // Formatters may pad the tag with spaces.
        const absl::string_view body = absl::StripAsciiWhitespace(
            SplitComment(tree->NodeText(node)).body);
        if (absl::StartsWith(body, "[[CMT_") && IsLiteralTag(body)) {
          RestoreFragment(body, mapping, &edits);
        }
        return false;
      }
      default:
        return true;
    }
  });
  VLOG(1) << "Structural restore replaced " << edits.size() << " nodes";
  return edits.Apply(masked);
}

std::string Restore(absl::string_view masked, const Mapping &mapping,
                    absl::string_view language_id, RestoreMode mode,
                    const LanguageRegistry &registry) {
  VLOG(1) << "Restore " << language_id << " in " << mode << " mode, "
          << mapping.size() << " mapping entries";
  if (mode == RestoreMode::kStructural) {
    auto restored = RestoreStructurally(masked, mapping, language_id, registry);
    if (restored.ok()) return *std::move(restored);
    LOG(WARNING) << "Falling back to tag restore: " << restored.status();
  }
  return RestoreTags(masked, mapping);
}

std::string Restore(absl::string_view masked, const Mapping &mapping,
                    absl::string_view language_id, RestoreMode mode) {
  return Restore(masked, mapping, language_id, mode,
                 LanguageRegistry::Default());
}

absl::StatusOr<std::string> RestoreWithMap(absl::string_view masked,
                                           absl::string_view mapping_json,
                                           absl::string_view language_id,
                                           RestoreMode mode) {
  ASSIGN_OR_RETURN(const Mapping mapping, ParseMappingJson(mapping_json));
  return Restore(masked, mapping, language_id, mode);
}

}  // namespace deepsan
