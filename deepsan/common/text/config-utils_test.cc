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

#include "deepsan/common/text/config-utils.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "re2/re2.h"

namespace deepsan {
namespace {

using config::SetBool;
using config::SetInt;
using config::SetRegex;
using config::SetString;
using config::SetStringList;
using config::SetStringOneOf;
using ::testing::ElementsAre;

TEST(ConfigUtilsTest, EmptyConfigIsOk) {
  bool value = false;
  EXPECT_TRUE(ParseNameValues("", {{"maskStrings", SetBool(&value)}}).ok());
  EXPECT_TRUE(ParseNameValues(" ; ;\n", {{"maskStrings", SetBool(&value)}})
                  .ok());
  EXPECT_FALSE(value);
}

TEST(ConfigUtilsTest, UnknownParameter) {
  bool value = false;
  absl::Status status =
      ParseNameValues("maskString:on", {{"maskStrings", SetBool(&value)}});
  EXPECT_FALSE(status.ok());
  EXPECT_TRUE(absl::StrContains(status.message(), "maskString: unknown"))
      << status.message();
  EXPECT_TRUE(absl::StrContains(status.message(), "parameter is 'maskStrings'"));

  status = ParseNameValues("bogus", {{"a", nullptr}, {"b", nullptr}});
  EXPECT_TRUE(absl::StrContains(status.message(), "parameters are 'a', 'b'"))
      << status.message();
}

TEST(ConfigUtilsTest, ParameterWithoutSetterIsConsumed) {
  EXPECT_TRUE(ParseNameValues("copyToClipboard:on",
                              {{"copyToClipboard", nullptr}})
                  .ok());
}

TEST(ConfigUtilsTest, BoolValues) {
  bool mask_strings = false;
  bool remove_comments = true;
  EXPECT_TRUE(ParseNameValues("maskStrings: on ; removeComments:off",
                              {{"maskStrings", SetBool(&mask_strings)},
                               {"removeComments", SetBool(&remove_comments)}})
                  .ok());
  EXPECT_TRUE(mask_strings);
  EXPECT_FALSE(remove_comments);

  EXPECT_TRUE(ParseNameValues("removeComments",
                              {{"removeComments", SetBool(&remove_comments)}})
                  .ok());
  EXPECT_TRUE(remove_comments);

  for (const absl::string_view v : {"0", "false", "FALSE", "Off"}) {
    bool b = true;
    EXPECT_TRUE(ParseNameValues(std::string("b:") + std::string(v),
                                {{"b", SetBool(&b)}})
                    .ok());
    EXPECT_FALSE(b) << v;
  }

  const absl::Status status =
      ParseNameValues("maskStrings:maybe", {{"maskStrings", SetBool(&mask_strings)}});
  EXPECT_FALSE(status.ok());
  EXPECT_TRUE(absl::StrContains(status.message(), "maskStrings: 'maybe'"))
      << status.message();
}

TEST(ConfigUtilsTest, IntValues) {
  int value = 2;
  EXPECT_TRUE(
      ParseNameValues("minNameLength: 4", {{"minNameLength", SetInt(&value, 1, 64)}})
          .ok());
  EXPECT_EQ(value, 4);

  absl::Status status = ParseNameValues(
      "minNameLength:0", {{"minNameLength", SetInt(&value, 1, 64)}});
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.message(), "minNameLength: 0 out of range [1...64]");

  status = ParseNameValues("minNameLength:two",
                           {{"minNameLength", SetInt(&value, 1, 64)}});
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(status.message(), "minNameLength: 'two': cannot parse integer");
  EXPECT_EQ(value, 4);
}

TEST(ConfigUtilsTest, StringValueKeepsColons) {
  std::string value;
  EXPECT_TRUE(
      ParseNameValues("label: a:b ", {{"label", SetString(&value)}}).ok());
  EXPECT_EQ(value, "a:b");
}

TEST(ConfigUtilsTest, StringOneOf) {
  std::string mode = "append";
  EXPECT_TRUE(ParseNameValues("whitelistMode:overwrite",
                              {{"whitelistMode",
                                SetStringOneOf(&mode, {"append", "overwrite"})}})
                  .ok());
  EXPECT_EQ(mode, "overwrite");

  const absl::Status status = ParseNameValues(
      "whitelistMode:replace",
      {{"whitelistMode", SetStringOneOf(&mode, {"append", "overwrite"})}});
  EXPECT_FALSE(status.ok());
  EXPECT_TRUE(absl::StrContains(status.message(),
                                "one of ['append', 'overwrite']; got 'replace'"))
      << status.message();
  EXPECT_EQ(mode, "overwrite");
}

TEST(ConfigUtilsTest, StringListAppends) {
  std::vector<std::string> names{"React"};
  EXPECT_TRUE(ParseNameValues("whitelist: apiKey , ,userName",
                              {{"whitelist", SetStringList(&names)}})
                  .ok());
  EXPECT_THAT(names, ElementsAre("React", "apiKey", "userName"));
}

TEST(ConfigUtilsTest, RegexValue) {
  std::unique_ptr<re2::RE2> regex;
  EXPECT_TRUE(
      ParseNameValues("keepPattern:^gl[A-Z]", {{"keepPattern", SetRegex(&regex)}})
          .ok());
  ASSERT_NE(regex, nullptr);
  EXPECT_TRUE(re2::RE2::PartialMatch("glBindBuffer", *regex));
  EXPECT_FALSE(re2::RE2::PartialMatch("bindBuffer", *regex));

  const absl::Status status =
      ParseNameValues("keepPattern:(", {{"keepPattern", SetRegex(&regex)}});
  EXPECT_FALSE(status.ok());
  EXPECT_TRUE(absl::StrContains(status.message(), "regular expression"));
}

}  // namespace
}  // namespace deepsan
