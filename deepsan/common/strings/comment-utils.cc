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

#include "deepsan/common/strings/comment-utils.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <ostream>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"

namespace deepsan {

std::ostream &operator<<(std::ostream &stream, CommentStyle style) {
  switch (style) {
    case CommentStyle::kLine:
      return stream << "line";
    case CommentStyle::kHash:
      return stream << "hash";
    case CommentStyle::kBlock:
      return stream << "block";
    case CommentStyle::kDocBlock:
      return stream << "doc-block";
    case CommentStyle::kUnknown:
      break;
  }
  return stream << "unknown";
}

// Returns the number of occurences of a character c in the text's prefix.
static size_t CountLeadingChars(absl::string_view text, char c) {
  const auto rpos = text.find_first_not_of(c);
  if (rpos == absl::string_view::npos) return text.length();
  return rpos;
}

// Returns the number of occurences of a character c in the text's suffix.
static size_t CountTrailingChars(absl::string_view text, char c) {
  const auto rpos = std::find_if(text.rbegin(), text.rend(),
                                 [=](const char ch) { return ch != c; });
  return std::distance(text.rbegin(), rpos);
}

CommentStyle ClassifyComment(absl::string_view text) {
  if (absl::StartsWith(text, "#")) return CommentStyle::kHash;
  if (absl::StartsWith(text, "//")) return CommentStyle::kLine;
  if (text.length() >= 4 && absl::StartsWith(text, "/*") &&
      absl::EndsWith(text, "*/")) {
    // "/**/" is an empty plain block, not a doc block.
    if (absl::StartsWith(text, "/**") && text != "/**/") {
      return CommentStyle::kDocBlock;
    }
    return CommentStyle::kBlock;
  }
  return CommentStyle::kUnknown;
}

// Splits "/*** body ***/".  The caller has checked both delimiters.
static CommentParts SplitBlockComment(CommentStyle style,
                                      absl::string_view text) {
  const size_t lpos = CountLeadingChars(text.substr(2), '*') + 2;
  absl::string_view text_slice = text;
  text_slice.remove_suffix(2);
  const size_t rpos = text.length() - CountTrailingChars(text_slice, '*') - 2;
  if (lpos > rpos) {
    // "/*****/": all stars, split the run between head and tail.
    const size_t half = text.length() / 2;
    return {style, text.substr(0, half), text.substr(half, 0),
            text.substr(half)};
  }
  return {style, text.substr(0, lpos), text.substr(lpos, rpos - lpos),
          text.substr(rpos)};
}

CommentParts SplitComment(absl::string_view text) {
  const CommentStyle style = ClassifyComment(text);
  switch (style) {
    case CommentStyle::kLine: {
      const size_t ltrim = CountLeadingChars(text, '/');
      return {style, text.substr(0, ltrim), text.substr(ltrim),
              text.substr(text.length())};
    }
    case CommentStyle::kHash: {
      const size_t ltrim = CountLeadingChars(text, '#');
      return {style, text.substr(0, ltrim), text.substr(ltrim),
              text.substr(text.length())};
    }
    case CommentStyle::kBlock:
    case CommentStyle::kDocBlock:
      return SplitBlockComment(style, text);
    case CommentStyle::kUnknown:
      break;
  }
  return {style, text.substr(0, 0), text, text.substr(text.length())};
}

absl::string_view StripCommentAndSpacePadding(absl::string_view text) {
  return absl::StripAsciiWhitespace(StripComment(text));
}

}  // namespace deepsan
