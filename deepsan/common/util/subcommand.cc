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

#include <ostream>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace deepsan {

static constexpr absl::string_view kHelpUsage =
    "help [command]\n"
    "Prints the usage of a command, or lists the commands.\n";

static absl::string_view Synopsis(absl::string_view usage) {
  return usage.substr(0, usage.find('\n'));
}

absl::Status SubcommandRegistry::RegisterCommand(absl::string_view name,
                                                 SubcommandEntry entry) {
  if (name == "help" || commands_.find(name) != commands_.end()) {
    return absl::InvalidArgumentError(
        absl::StrCat("A command named \"", name, "\" is already registered."));
  }
  commands_.emplace(std::string(name), std::move(entry));
  listing_.emplace_back(name);
  return absl::OkStatus();
}

absl::Status SubcommandRegistry::Run(absl::string_view command,
                                     const SubcommandArgsRange &args,
                                     std::ostream &outs,
                                     std::ostream &errs) const {
  if (command == "help") return Help(args, errs);
  const auto found = commands_.find(command);
  if (found == commands_.end()) {
    errs << "available commands:\n" << ListCommands() << std::endl;
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown command \"", command, "\"."));
  }
  return found->second.main(args, outs, errs);
}

std::string SubcommandRegistry::ListCommands() const {
  std::string listing;
  for (const std::string &name : listing_) {
    const SubcommandEntry &entry = commands_.find(name)->second;
    absl::StrAppend(&listing, "  ", Synopsis(entry.usage), "\n");
  }
  absl::StrAppend(&listing, "  ", Synopsis(kHelpUsage), "\n");
  return listing;
}

absl::Status SubcommandRegistry::Help(const SubcommandArgsRange &args,
                                      std::ostream &errs) const {
  if (args.empty()) {
    errs << "available commands:\n" << ListCommands() << std::endl;
    return absl::OkStatus();
  }
  if (args.front() == "help") {
    errs << kHelpUsage << std::endl;
    return absl::OkStatus();
  }
  const auto found = commands_.find(args.front());
  if (found == commands_.end()) {
    errs << "available commands:\n" << ListCommands() << std::endl;
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown command \"", args.front(), "\"."));
  }
  errs << found->second.usage << std::endl;
  return absl::OkStatus();
}

}  // namespace deepsan
