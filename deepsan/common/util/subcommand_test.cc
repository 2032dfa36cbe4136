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

#include "deepsan/common/util/subcommand.h"

#include <sstream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace deepsan {
namespace {

using ::testing::HasSubstr;

SubcommandEntry EchoArgs() {
  return {[](const SubcommandArgsRange &args, std::ostream &outs,
             std::ostream &) {
            outs << absl::StrJoin(args, ",");
            return absl::OkStatus();
          },
          "echo [args...]\nPrints its arguments.\n"};
}

TEST(SubcommandRegistryTest, ListingShowsSynopsesInRegistrationOrder) {
  SubcommandRegistry registry;
  ASSERT_TRUE(registry.RegisterCommand("sanitize", EchoArgs()).ok());
  SubcommandEntry restore = EchoArgs();
  restore.usage = "restore [file]\nPuts names back.\n";
  ASSERT_TRUE(registry.RegisterCommand("restore", restore).ok());
  EXPECT_EQ(registry.ListCommands(),
            "  echo [args...]\n  restore [file]\n  help [command]\n");
}

TEST(SubcommandRegistryTest, RunPassesArgs) {
  SubcommandRegistry registry;
  ASSERT_TRUE(registry.RegisterCommand("sanitize", EchoArgs()).ok());
  const std::vector<absl::string_view> args{"a.ts", "b.ts"};
  std::ostringstream outs, errs;
  const auto status = registry.Run("sanitize", args, outs, errs);
  EXPECT_TRUE(status.ok()) << status;
  EXPECT_EQ(outs.str(), "a.ts,b.ts");
  EXPECT_TRUE(errs.str().empty());
}

TEST(SubcommandRegistryTest, HelpWithoutArgsListsCommands) {
  SubcommandRegistry registry;
  ASSERT_TRUE(registry.RegisterCommand("sanitize", EchoArgs()).ok());
  std::ostringstream outs, errs;
  EXPECT_TRUE(registry.Run("help", {}, outs, errs).ok());
  EXPECT_TRUE(outs.str().empty());
  EXPECT_THAT(errs.str(), HasSubstr("available commands:\n  echo [args...]"));
}

TEST(SubcommandRegistryTest, HelpForOneCommandPrintsUsage) {
  SubcommandRegistry registry;
  ASSERT_TRUE(registry.RegisterCommand("restore", EchoArgs()).ok());
  const std::vector<absl::string_view> args{"restore"};
  std::ostringstream outs, errs;
  EXPECT_TRUE(registry.Run("help", args, outs, errs).ok());
  EXPECT_THAT(errs.str(), HasSubstr("Prints its arguments."));
}

TEST(SubcommandRegistryTest, HelpForUnknownCommandIsAnError) {
  SubcommandRegistry registry;
  const std::vector<absl::string_view> args{"obfuscate"};
  std::ostringstream outs, errs;
  const auto status = registry.Run("help", args, outs, errs);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(errs.str(), HasSubstr("available commands"));
}

TEST(SubcommandRegistryTest, DuplicateRegistrationFails) {
  SubcommandRegistry registry;
  EXPECT_TRUE(registry.RegisterCommand("sanitize", EchoArgs()).ok());
  EXPECT_EQ(registry.RegisterCommand("sanitize", EchoArgs()).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(registry.RegisterCommand("help", EchoArgs()).code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(SubcommandRegistryTest, UnknownCommandIsAnError) {
  SubcommandRegistry registry;
  std::ostringstream outs, errs;
  const auto status = registry.Run("obfuscate", {}, outs, errs);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("obfuscate"));
  EXPECT_THAT(errs.str(), HasSubstr("available commands"));
}

}  // namespace
}  // namespace deepsan
