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

#include "deepsan/common/text/replacement-edit.h"

#include "absl/strings/string_view.h"
#include "gtest/gtest.h"

namespace deepsan {
namespace {

TEST(EditSetTest, NoEditsCopiesInput) {
  const EditSet edits;
  EXPECT_TRUE(edits.empty());
  EXPECT_EQ(edits.Apply("const total = 1;"), "const total = 1;");
  EXPECT_EQ(edits.Apply(""), "");
}

TEST(EditSetTest, EditsAppliedRegardlessOfInsertionOrder) {
  constexpr absl::string_view text = "let a = b + a;";
  EditSet edits;
  // Added back to front.
  EXPECT_TRUE(edits.Add({text.substr(12, 1), "VAR_1"}));
  EXPECT_TRUE(edits.Add({text.substr(8, 1), "VAR_2"}));
  EXPECT_TRUE(edits.Add({text.substr(4, 1), "VAR_1"}));
  EXPECT_EQ(edits.size(), 3);
  EXPECT_EQ(edits.Apply(text), "let VAR_1 = VAR_2 + VAR_1;");
}

TEST(EditSetTest, GrowingAndShrinkingReplacements) {
  constexpr absl::string_view text = "x userName y";
  EditSet edits;
  EXPECT_TRUE(edits.Add({text.substr(0, 1), "first"}));
  EXPECT_TRUE(edits.Add({text.substr(2, 8), "S"}));
  EXPECT_TRUE(edits.Add({text.substr(11, 1), ""}));
  EXPECT_EQ(edits.Apply(text), "first S ");
}

TEST(EditSetTest, EditsAtBufferBoundaries) {
  constexpr absl::string_view text = "abc";
  EditSet edits;
  EXPECT_TRUE(edits.Add({text.substr(0, 1), "A"}));
  EXPECT_TRUE(edits.Add({text.substr(2, 1), "C"}));
  EXPECT_EQ(edits.Apply(text), "AbC");
}

TEST(EditSetTest, OverlappingEditRejected) {
  constexpr absl::string_view text = "/* comment */ value";
  EditSet edits;
  EXPECT_TRUE(edits.Add({text.substr(2, 9), "[[CMT_1]]"}));
  EXPECT_FALSE(edits.Add({text.substr(3, 7), "VAR_1"}));
  EXPECT_FALSE(edits.Add({text.substr(0, 13), "gone"}));
  EXPECT_TRUE(edits.Add({text.substr(14, 5), "VAR_2"}));
  EXPECT_EQ(edits.size(), 2);
  EXPECT_EQ(edits.Apply(text), "/*[[CMT_1]]*/ VAR_2");
}

TEST(EditSetTest, TokenBasedEdit) {
  constexpr absl::string_view text = "save(user)";
  EditSet edits;
  EXPECT_TRUE(edits.Add({TokenInfo(1, text.substr(0, 4)), "ACTION_1"}));
  EXPECT_EQ(edits.Apply(text), "ACTION_1(user)");
}

}  // namespace
}  // namespace deepsan
