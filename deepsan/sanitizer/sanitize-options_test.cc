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

#include "deepsan/sanitizer/sanitize-options.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "re2/re2.h"

namespace deepsan {
namespace {

using ::testing::ElementsAre;

TEST(SanitizeOptionsTest, Defaults) {
  const SanitizeOptions options;
  EXPECT_TRUE(options.CategoryEnabled(Category::kVariable));
  EXPECT_TRUE(options.CategoryEnabled(Category::kFunction));
  EXPECT_TRUE(options.CategoryEnabled(Category::kClass));
  EXPECT_TRUE(options.CategoryEnabled(Category::kType));
  EXPECT_FALSE(options.mask_strings);
  EXPECT_FALSE(options.remove_comments);
  EXPECT_EQ(options.whitelist_mode, WhitelistMode::kAppend);
  EXPECT_EQ(options.min_name_length, 2);
  EXPECT_EQ(options.keep_pattern, nullptr);
}

TEST(SanitizeOptionsTest, MaskClassesCoversTypes) {
  SanitizeOptions options;
  options.mask_classes = false;
  EXPECT_FALSE(options.CategoryEnabled(Category::kClass));
  EXPECT_FALSE(options.CategoryEnabled(Category::kType));
  EXPECT_TRUE(options.CategoryEnabled(Category::kVariable));
}

TEST(ParseSanitizeOptionsTest, AllSettings) {
  SanitizeOptions options;
  const absl::Status status = ParseSanitizeOptions(
      "maskVariables:off; maskFunctions:false; maskClasses:0;"
      "maskStrings:on; removeComments; whitelist:apiClient, CONFIG;"
      "whitelistMode:overwrite; minNameLength:3; keepPattern:^gl[A-Z];"
      "copyToClipboard:true",
      &options);
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_FALSE(options.mask_vars);
  EXPECT_FALSE(options.mask_funcs);
  EXPECT_FALSE(options.mask_classes);
  EXPECT_TRUE(options.mask_strings);
  EXPECT_TRUE(options.remove_comments);
  EXPECT_THAT(options.whitelist, ElementsAre("apiClient", "CONFIG"));
  EXPECT_EQ(options.whitelist_mode, WhitelistMode::kOverwrite);
  EXPECT_EQ(options.min_name_length, 3);
  ASSERT_NE(options.keep_pattern, nullptr);
  EXPECT_TRUE(re2::RE2::PartialMatch("glDrawArrays", *options.keep_pattern));
}

TEST(ParseSanitizeOptionsTest, ShortAliases) {
  SanitizeOptions options;
  ASSERT_TRUE(ParseSanitizeOptions("maskVars:off\nmaskFuncs:off", &options).ok());
  EXPECT_FALSE(options.mask_vars);
  EXPECT_FALSE(options.mask_funcs);
  EXPECT_TRUE(options.mask_classes);
}

TEST(ParseSanitizeOptionsTest, WhitelistAppendsToExisting) {
  SanitizeOptions options;
  options.whitelist = {"React"};
  ASSERT_TRUE(ParseSanitizeOptions("whitelist:apiClient", &options).ok());
  EXPECT_THAT(options.whitelist, ElementsAre("React", "apiClient"));
}

TEST(ParseSanitizeOptionsTest, EmptyConfigChangesNothing) {
  SanitizeOptions options;
  options.mask_strings = true;
  ASSERT_TRUE(ParseSanitizeOptions("", &options).ok());
  EXPECT_TRUE(options.mask_strings);
  EXPECT_EQ(options.whitelist_mode, WhitelistMode::kAppend);
}

TEST(ParseSanitizeOptionsTest, ErrorsLeaveOptionsUnchanged) {
  SanitizeOptions options;
  const char *kBadConfigs[] = {
      "maskStrings:on;maskEverything:on",
      "maskStrings:on;whitelistMode:replace",
      "maskStrings:on;minNameLength:0",
      "maskStrings:on;keepPattern:(",
      "maskStrings:maybe",
  };
  for (const char *config : kBadConfigs) {
    const absl::Status status = ParseSanitizeOptions(config, &options);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument) << config;
    EXPECT_FALSE(options.mask_strings) << config;
  }
}

TEST(ParseSanitizeOptionsTest, UnknownNameListsSupportedOnes) {
  SanitizeOptions options;
  const absl::Status status = ParseSanitizeOptions("maskAll:on", &options);
  EXPECT_TRUE(absl::StrContains(status.message(), "maskAll: unknown parameter"))
      << status;
  EXPECT_TRUE(absl::StrContains(status.message(), "'removeComments'"))
      << status;
}

}  // namespace
}  // namespace deepsan
