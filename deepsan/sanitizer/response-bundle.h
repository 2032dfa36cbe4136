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

#ifndef DEEPSAN_SANITIZER_RESPONSE_BUNDLE_H_
#define DEEPSAN_SANITIZER_RESPONSE_BUNDLE_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "deepsan/sanitizer/restore.h"

namespace deepsan {

// Instructions placed at the top of a bundle.
extern const char kAssistantInstructions[];

// Builds the document handed to an assistant: a "prompt:" block with
// kAssistantInstructions, a "code" block fenced with the language id, and a
// "map table" block with the mapping as JSON.  Fails if the mapping cannot
// be written as JSON.
absl::StatusOr<std::string> BuildResponseBundle(absl::string_view sanitized,
                                const Mapping &mapping,
                                absl::string_view language_id);

struct ResponseBundle {
  std::string code;
  Mapping mapping;
};

// Reads back a document in the BuildResponseBundle() layout, typically an
// assistant's reply.  Without a "code" block the whole text is the code;
// without a "map table" block the mapping is empty.  A map table that is not
// a flat JSON object of strings is InvalidArgument.
absl::StatusOr<ResponseBundle> ParseResponseBundle(absl::string_view text);

// Restores the code of "reply" with its map table, completed by "saved" for
// names the table lacks.  A reply restored with no mapping at all would come
// back still masked, so an empty merged mapping is InvalidArgument.
absl::StatusOr<std::string> RestoreResponseBundle(absl::string_view reply,
                                                  const Mapping &saved,
                                                  absl::string_view language_id,
                                                  RestoreMode mode);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_RESPONSE_BUNDLE_H_
