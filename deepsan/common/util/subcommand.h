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

#ifndef DEEPSAN_COMMON_UTIL_SUBCOMMAND_H_
#define DEEPSAN_COMMON_UTIL_SUBCOMMAND_H_

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "deepsan/common/strings/compare.h"

namespace deepsan {

// Positional arguments that follow the subcommand name.
using SubcommandArgsRange = absl::Span<const absl::string_view>;

using SubcommandFunction = std::function<absl::Status(
    const SubcommandArgsRange &, std::ostream &outs, std::ostream &errs)>;

struct SubcommandEntry {
  SubcommandFunction main;

  // Full description.  The first line is the synopsis shown in listings.
  std::string usage;
};

// Dispatches a tool's subcommands by name.  "help [command]" is built in.
class SubcommandRegistry {
 public:
  SubcommandRegistry() = default;

  SubcommandRegistry(const SubcommandRegistry &) = delete;
  SubcommandRegistry &operator=(const SubcommandRegistry &) = delete;

  // Returns an error if the name is taken, "help" included.
  absl::Status RegisterCommand(absl::string_view name, SubcommandEntry entry);

  // Runs "command" with "args".  An unknown command prints the listing to
  // "errs" and is InvalidArgument.
  absl::Status Run(absl::string_view command, const SubcommandArgsRange &args,
                   std::ostream &outs, std::ostream &errs) const;

  // Synopsis of every command, one per line, in registration order.
  std::string ListCommands() const;

 private:
  absl::Status Help(const SubcommandArgsRange &args, std::ostream &errs) const;

  std::map<std::string, SubcommandEntry, StringViewCompare> commands_;
  std::vector<std::string> listing_;
};

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_UTIL_SUBCOMMAND_H_
