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

#include <sstream>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gtest/gtest.h"

namespace deepsan {
namespace {

struct SplitTestCase {
  absl::string_view input;
  CommentStyle style;
  absl::string_view head;
  absl::string_view body;
  absl::string_view tail;
};

TEST(SplitCommentTest, Various) {
  const SplitTestCase kTestCases[] = {
      {"// secret note", CommentStyle::kLine, "//", " secret note", ""},
      {"//", CommentStyle::kLine, "//", "", ""},
      {"/// triple", CommentStyle::kLine, "///", " triple", ""},
      {"# hash comment", CommentStyle::kHash, "#", " hash comment", ""},
      {"## twice", CommentStyle::kHash, "##", " twice", ""},
      {"/* block */", CommentStyle::kBlock, "/*", " block ", "*/"},
      {"/**/", CommentStyle::kBlock, "/*", "", "*/"},
      {"/*** stars ***/", CommentStyle::kDocBlock, "/***", " stars ", "***/"},
      {"/** doc\n * line\n */", CommentStyle::kDocBlock, "/**",
       " doc\n * line\n ", "*/"},
      {"/*****/", CommentStyle::kDocBlock, "/**", "", "****/"},
      {"/* unterminated", CommentStyle::kUnknown, "", "/* unterminated", ""},
      {"plain text", CommentStyle::kUnknown, "", "plain text", ""},
      {"", CommentStyle::kUnknown, "", "", ""},
  };
  for (const auto &test : kTestCases) {
    const CommentParts parts = SplitComment(test.input);
    EXPECT_EQ(parts.style, test.style) << test.input;
    EXPECT_EQ(parts.head, test.head) << test.input;
    EXPECT_EQ(parts.body, test.body) << test.input;
    EXPECT_EQ(parts.tail, test.tail) << test.input;
    // The parts always reassemble the input.
    EXPECT_EQ(absl::StrCat(parts.head, parts.body, parts.tail), test.input);
  }
}

TEST(SplitCommentTest, PartsAreSubstringsOfInput) {
  const absl::string_view text = "/* inside */";
  const CommentParts parts = SplitComment(text);
  EXPECT_EQ(parts.head.data(), text.data());
  EXPECT_EQ(parts.body.data(), text.data() + 2);
  EXPECT_EQ(parts.tail.data() + parts.tail.size(), text.data() + text.size());
}

TEST(StripCommentTest, PaddingRemoved) {
  EXPECT_EQ(StripCommentAndSpacePadding("//   spaced out  "), "spaced out");
  EXPECT_EQ(StripCommentAndSpacePadding("/*\n  x\n*/"), "x");
  EXPECT_EQ(StripComment("# keep "), " keep ");
}

TEST(CommentStyleTest, Print) {
  std::ostringstream stream;
  stream << CommentStyle::kDocBlock << ',' << CommentStyle::kHash;
  EXPECT_EQ(stream.str(), "doc-block,hash");
}

}  // namespace
}  // namespace deepsan
