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

#include "deepsan/sanitizer/mapping-table.h"

#include <string>

#include "deepsan/sanitizer/category.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace deepsan {
namespace {

using ::testing::ElementsAre;
using ::testing::Pair;

TEST(LooksLikeMaskedNameTest, Shapes) {
  for (const char *name : {"VAR_1", "ACTION_12", "ENTITY_3", "CLASS_2",
                           "TYPE_9", "LIST_1", "PROPS_DEF_4", "PROPS_1",
                           "HOOK_1", "STR_7"}) {
    EXPECT_TRUE(LooksLikeMaskedName(name)) << name;
  }
  for (const char *name : {"VAR_", "VAR1", "VAR_x", "FOO_1", "var_1",
                           "MAX_RETRIES", "_1", "[[STR_1]]", ""}) {
    EXPECT_FALSE(LooksLikeMaskedName(name)) << name;
  }
}

TEST(IsLiteralTagTest, Shapes) {
  EXPECT_TRUE(IsLiteralTag("[[STR_1]]"));
  EXPECT_TRUE(IsLiteralTag("[[CMT_20]]"));
  EXPECT_FALSE(IsLiteralTag("[[STR_]]"));
  EXPECT_FALSE(IsLiteralTag("[[VAR_1]]"));
  EXPECT_FALSE(IsLiteralTag("[STR_1]"));
  EXPECT_FALSE(IsLiteralTag("STR_1"));
  EXPECT_FALSE(IsLiteralTag("\"[[STR_1]]\""));
}

TEST(MappingTableTest, GetOrCreateIsIdempotent) {
  MappingTable table;
  EXPECT_EQ(table.GetOrCreate("add", Category::kFunction), "ACTION_1");
  EXPECT_EQ(table.GetOrCreate("add", Category::kFunction), "ACTION_1");
  // The first category sticks.
  EXPECT_EQ(table.GetOrCreate("add", Category::kVariable), "ACTION_1");
  EXPECT_EQ(table.name_count(), 1u);
}

TEST(MappingTableTest, CountersArePerPrefix) {
  MappingTable table;
  EXPECT_EQ(table.GetOrCreate("alpha", Category::kVariable), "VAR_1");
  EXPECT_EQ(table.GetOrCreate("compute", Category::kFunction), "ACTION_1");
  EXPECT_EQ(table.GetOrCreate("beta", Category::kVariable), "VAR_2");
  EXPECT_EQ(table.GetOrCreate("userList", Category::kVariable), "LIST_1");
  EXPECT_EQ(table.GetOrCreate("Widget", Category::kClass), "ENTITY_1");
  EXPECT_EQ(table.GetOrCreate("Shape", Category::kType), "TYPE_1");
  EXPECT_EQ(table.GetOrCreate("orders", Category::kFunction), "LIST_2");
}

TEST(MappingTableTest, SkipsTakenSpellings) {
  MappingTable table;
  table.MarkTaken("VAR_1");
  table.MarkTaken("VAR_2");
  EXPECT_EQ(table.GetOrCreate("alpha", Category::kVariable), "VAR_3");
  EXPECT_EQ(table.GetOrCreate("beta", Category::kVariable), "VAR_4");
}

TEST(MappingTableTest, WordsAnywhereAreTaken) {
  MappingTable table;
  table.MarkWordsTaken(
      "// fallback is VAR_1\n"
      "const label = \"ACTION_1 pending\"; // [[STR_1]] $VAR_2 VAR_3x\n");
  EXPECT_EQ(table.GetOrCreate("alpha", Category::kVariable), "VAR_2");
  EXPECT_EQ(table.GetOrCreate("compute", Category::kFunction), "ACTION_2");
  EXPECT_EQ(table.MintStringTag("'x'"), "[[STR_2]]");
}

TEST(MappingTableTest, FindBothDirections) {
  MappingTable table;
  table.GetOrCreate("isReady", Category::kVariable);
  ASSERT_NE(table.FindMasked("isReady"), nullptr);
  EXPECT_EQ(*table.FindMasked("isReady"), "BOOL_1");
  ASSERT_NE(table.FindOriginal("BOOL_1"), nullptr);
  EXPECT_EQ(*table.FindOriginal("BOOL_1"), "isReady");
  EXPECT_EQ(table.FindMasked("BOOL_1"), nullptr);
  EXPECT_EQ(table.FindOriginal("isReady"), nullptr);
}

TEST(MappingTableTest, StringTagsHaveTheirOwnCounter) {
  MappingTable table;
  EXPECT_EQ(table.GetOrCreate("userName", Category::kVariable), "STR_1");
  EXPECT_EQ(table.MintStringTag("'hello'"), "[[STR_1]]");
  EXPECT_EQ(table.MintStringTag("\"world\""), "[[STR_2]]");
  // Same literal text, same tag.
  EXPECT_EQ(table.MintStringTag("'hello'"), "[[STR_1]]");
  // A different quote style is a different literal.
  EXPECT_EQ(table.MintStringTag("\"hello\""), "[[STR_3]]");
  EXPECT_EQ(table.string_count(), 3u);
}

TEST(MappingTableTest, CommentTags) {
  MappingTable table;
  table.MarkTaken("CMT_1");
  EXPECT_EQ(table.MintCommentTag(" first"), "[[CMT_2]]");
  EXPECT_EQ(table.MintCommentTag(" second"), "[[CMT_3]]");
  EXPECT_EQ(table.MintCommentTag(" first"), "[[CMT_2]]");
  EXPECT_EQ(table.comment_count(), 2u);
}

TEST(MappingTableTest, ExportMapping) {
  MappingTable table;
  table.GetOrCreate("add", Category::kFunction);
  table.GetOrCreate("left", Category::kVariable);
  table.MintStringTag("'hi'");
  table.MintCommentTag(" note");
  EXPECT_THAT(table.ExportMapping(),
              ElementsAre(Pair("ACTION_1", "add"), Pair("VAR_1", "left"),
                          Pair("[[CMT_1]]", " note"),
                          Pair("[[STR_1]]", "'hi'")));
}

TEST(MappingTableTest, Entries) {
  MappingTable table;
  table.GetOrCreate("render2", Category::kFunction);
  table.GetOrCreate("Account", Category::kClass);
  const auto entries = table.Entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].original, "Account");
  EXPECT_EQ(entries[0].masked, "ENTITY_1");
  EXPECT_EQ(entries[0].category, Category::kClass);
  EXPECT_EQ(entries[1].original, "render2");
  EXPECT_EQ(entries[1].masked, "ACTION_1");
  EXPECT_EQ(entries[1].category, Category::kFunction);
}

TEST(MappingTableTest, ResetStartsOver) {
  MappingTable table;
  table.MarkTaken("VAR_1");
  table.GetOrCreate("alpha", Category::kVariable);
  table.MintStringTag("'x'");
  table.Reset();
  EXPECT_EQ(table.FindMasked("alpha"), nullptr);
  EXPECT_TRUE(table.ExportMapping().empty());
  EXPECT_EQ(table.GetOrCreate("beta", Category::kVariable), "VAR_1");
  EXPECT_EQ(table.MintStringTag("'y'"), "[[STR_1]]");
}

}  // namespace
}  // namespace deepsan
