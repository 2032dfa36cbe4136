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

#ifndef DEEPSAN_COMMON_STRINGS_COMMENT_UTILS_H_
#define DEEPSAN_COMMON_STRINGS_COMMENT_UTILS_H_

#include <iosfwd>

#include "absl/strings/string_view.h"

namespace deepsan {

enum class CommentStyle {
  kLine,      // "// ..."
  kHash,      // "# ..."
  kBlock,     // "/* ... */"
  kDocBlock,  // "/** ... */"
  kUnknown,
};

std::ostream &operator<<(std::ostream &, CommentStyle);

// A comment cut into its opening delimiter, content and closing delimiter.
// All three are substrings of the original text, and concatenating them
// reproduces it.
struct CommentParts {
  CommentStyle style;
  absl::string_view head;
  absl::string_view body;
  absl::string_view tail;
};

// Classifies a single lexed comment by its delimiters.
CommentStyle ClassifyComment(absl::string_view text);

// Splits a comment.  Repeated delimiter characters ("///", "##", "/***",
// "***/") are all part of head/tail.  Whitespace is part of the body, so
// "// note" yields head "//" and body " note".
// Text that is not a well-formed comment comes back whole as the body.
CommentParts SplitComment(absl::string_view text);

// Returns only the content of a comment, see SplitComment().
inline absl::string_view StripComment(absl::string_view text) {
  return SplitComment(text).body;
}

// Same as StripComment(), with surrounding whitespace removed.
absl::string_view StripCommentAndSpacePadding(absl::string_view text);

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_STRINGS_COMMENT_UTILS_H_
