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

#include "deepsan/sanitizer/response-bundle.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/common/util/status-macros.h"
#include "deepsan/sanitizer/mapping-json.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "deepsan/sanitizer/restore.h"
#include "re2/re2.h"

namespace deepsan {

const char kAssistantInstructions[] =
    "You are an expert developer. Refactor or fix the code below.\n"
    "IMPORTANT: The code is sanitized for security "
    "(e.g., VAR_1, ACTION_1, [[STR_1]]).\n"
    "1. Analyze the logic flow despite the obfuscated names.\n"
    "2. Do NOT change the masked names (keep VAR_1 as VAR_1).\n"
    "3. If you create NEW variables, use meaningful names.\n"
    "4. Return the result in the same format: Code block first, then the "
    "Map table block.";

absl::StatusOr<std::string> BuildResponseBundle(
    absl::string_view sanitized, const Mapping &mapping,
    absl::string_view language_id) {
  ASSIGN_OR_RETURN(const std::string mapping_json, MappingToJson(mapping));
  return absl::StrCat("prompt:\n```txt\n", kAssistantInstructions,
                      "\n```\n\ncode\n```", language_id, "\n", sanitized,
                      "\n```\n\nmap table\n```json\n", mapping_json,
                      "\n```");
}

absl::StatusOr<ResponseBundle> ParseResponseBundle(absl::string_view text) {
  static const re2::RE2 kCodeBlock(
      R"((?i)code\s*```[\w+]*\s*((?s:.*?))\s*```)");
  static const re2::RE2 kMapBlock(
      R"((?i)map table\s*```json\s*((?s:.*?))\s*```)");
  const re2::StringPiece input(text.data(), text.size());
  re2::StringPiece block;

  ResponseBundle bundle;
  if (re2::RE2::PartialMatch(input, kMapBlock, &block)) {
    ASSIGN_OR_RETURN(bundle.mapping, ParseMappingJson(absl::string_view(
                                         block.data(), block.size())));
  } else {
    VLOG(1) << "No map table block";
  }
  if (re2::RE2::PartialMatch(input, kCodeBlock, &block)) {
    bundle.code = std::string(block.data(), block.size());
  } else {
    VLOG(1) << "No code block, taking the whole text";
    bundle.code = std::string(text);
  }
  return bundle;
}

absl::StatusOr<std::string> RestoreResponseBundle(absl::string_view reply,
                                                  const Mapping &saved,
                                                  absl::string_view language_id,
                                                  RestoreMode mode) {
  ASSIGN_OR_RETURN(ResponseBundle bundle, ParseResponseBundle(reply));
  // Entries of the reply's own table take precedence.
  bundle.mapping.insert(saved.begin(), saved.end());
  if (bundle.mapping.empty()) {
    return absl::InvalidArgumentError(
        "Nothing to restore with: the reply has no map table and no saved "
        "mapping was given");
  }
  VLOG(1) << "Unbundled " << bundle.code.length() << " bytes of code, "
          << bundle.mapping.size() << " mapping entries";
  return Restore(bundle.code, bundle.mapping, language_id, mode);
}

}  // namespace deepsan
