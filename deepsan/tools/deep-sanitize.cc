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

// deep-sanitize: masks the names, string literals and comments of a source
// file before it is shared, and puts them back afterwards.

#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/usage.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/file-util.h"
#include "deepsan/common/util/init-command-line.h"
#include "deepsan/common/util/status-macros.h"
#include "deepsan/common/util/subcommand.h"
#include "deepsan/lang/language-registry.h"
#include "deepsan/sanitizer/mapping-json.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "deepsan/sanitizer/response-bundle.h"
#include "deepsan/sanitizer/restore.h"
#include "deepsan/sanitizer/sanitize-options.h"
#include "deepsan/sanitizer/sanitize.h"

ABSL_FLAG(std::string, language, "",
          "Language id: javascript, javascriptreact, typescript, "
          "typescriptreact or python.  Inferred from the file extension if "
          "empty.");
ABSL_FLAG(std::string, config, "",
          "Sanitize options as name:value pairs separated by ';', e.g. "
          "\"maskStrings:on;removeComments:on;whitelistMode:append\".");
ABSL_FLAG(std::vector<std::string>, whitelist, {},
          "Comma-separated names that are never masked, added to the "
          "config's whitelist.");
ABSL_FLAG(std::string, save_map, "",
          "If set, write the mapping as JSON to this file.");
ABSL_FLAG(std::string, load_map, "",
          "Mapping JSON file used for restoring.");
ABSL_FLAG(deepsan::RestoreMode, mode, deepsan::RestoreMode::kTag,
          "Restore mode: tag (tolerates reformatted text) or structural "
          "(only touches identifiers, literals and comments).");

using deepsan::SubcommandArgsRange;
using deepsan::SubcommandEntry;

namespace {

struct Input {
  std::string filename;
  std::string content;
  std::string language_id;
};

// Reads the file named by the first argument, stdin by default.
// "require_language": fail if the language is neither given nor inferable.
absl::StatusOr<Input> ReadInput(const SubcommandArgsRange &args,
                                bool require_language) {
  if (args.size() > 1) {
    return absl::InvalidArgumentError("Expected at most one input file.");
  }
  Input input;
  input.filename = args.empty() ? "-" : std::string(args[0]);
  ASSIGN_OR_RETURN(input.content,
                   deepsan::file::GetContentAsString(input.filename));
  input.language_id = absl::GetFlag(FLAGS_language);
  if (input.language_id.empty()) {
    input.language_id =
        std::string(deepsan::LanguageIdForFilename(input.filename));
  }
  if (require_language && input.language_id.empty()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Cannot infer the language of ", input.filename,
        "; use --language"));
  }
  return input;
}

absl::StatusOr<deepsan::SanitizeOptions> OptionsFromFlags() {
  deepsan::SanitizeOptions options;
  RETURN_IF_ERROR(
      deepsan::ParseSanitizeOptions(absl::GetFlag(FLAGS_config), &options));
  for (const std::string &name : absl::GetFlag(FLAGS_whitelist)) {
    if (!name.empty()) options.whitelist.push_back(name);
  }
  return options;
}

absl::StatusOr<deepsan::SanitizeResult> SanitizeInput(const Input &input,
                                                      std::ostream &errs) {
  ASSIGN_OR_RETURN(const deepsan::SanitizeOptions options, OptionsFromFlags());
  deepsan::SanitizeResult result =
      deepsan::Sanitize(input.content, input.language_id, options);
  if (!result.status.ok()) {
    errs << input.filename << ": left unmasked: " << result.status.message()
         << std::endl;
  }
  const std::string save_map = absl::GetFlag(FLAGS_save_map);
  if (!save_map.empty()) {
    ASSIGN_OR_RETURN(const std::string mapping_json,
                     deepsan::MappingToJson(result.mapping));
    RETURN_IF_ERROR(deepsan::file::SetContents(
        save_map, absl::StrCat(mapping_json, "\n")));
  }
  return result;
}

absl::Status SanitizeCommand(const SubcommandArgsRange &args,
                             std::ostream &outs, std::ostream &errs) {
  ASSIGN_OR_RETURN(const Input input, ReadInput(args, true));
  ASSIGN_OR_RETURN(const deepsan::SanitizeResult result,
                   SanitizeInput(input, errs));
  outs << result.sanitized;
  return absl::OkStatus();
}

absl::Status BundleCommand(const SubcommandArgsRange &args,
                           std::ostream &outs, std::ostream &errs) {
  ASSIGN_OR_RETURN(const Input input, ReadInput(args, true));
  ASSIGN_OR_RETURN(const deepsan::SanitizeResult result,
                   SanitizeInput(input, errs));
  ASSIGN_OR_RETURN(const std::string bundle,
                   deepsan::BuildResponseBundle(
                       result.sanitized, result.mapping, input.language_id));
  outs << bundle << std::endl;
  return absl::OkStatus();
}

absl::Status RestoreCommand(const SubcommandArgsRange &args,
                            std::ostream &outs, std::ostream &) {
  const std::string load_map = absl::GetFlag(FLAGS_load_map);
  if (load_map.empty()) {
    return absl::InvalidArgumentError("restore needs --load_map");
  }
  ASSIGN_OR_RETURN(const Input input, ReadInput(args, false));
  ASSIGN_OR_RETURN(const std::string mapping_json,
                   deepsan::file::GetContentAsString(load_map));
  ASSIGN_OR_RETURN(const std::string restored,
                   deepsan::RestoreWithMap(input.content, mapping_json,
                                           input.language_id,
                                           absl::GetFlag(FLAGS_mode)));
  outs << restored;
  return absl::OkStatus();
}

absl::Status UnbundleCommand(const SubcommandArgsRange &args,
                             std::ostream &outs, std::ostream &) {
  ASSIGN_OR_RETURN(const Input input, ReadInput(args, false));
  deepsan::Mapping saved;
  const std::string load_map = absl::GetFlag(FLAGS_load_map);
  if (!load_map.empty()) {
    ASSIGN_OR_RETURN(const std::string mapping_json,
                     deepsan::file::GetContentAsString(load_map));
    ASSIGN_OR_RETURN(saved, deepsan::ParseMappingJson(mapping_json));
  }
  ASSIGN_OR_RETURN(const std::string restored,
                   deepsan::RestoreResponseBundle(input.content, saved,
                                                  input.language_id,
                                                  absl::GetFlag(FLAGS_mode)));
  outs << restored << std::endl;
  return absl::OkStatus();
}

const std::pair<absl::string_view, SubcommandEntry> kCommands[] = {
    {"sanitize",  //
     {&SanitizeCommand,
      R"(sanitize [file]

Input:
'file' is a JavaScript, TypeScript or Python source, '-' or absent for stdin.

Output: (stdout)
The masked source.  With --save_map, the mapping from masked names and tags
back to the originals is written as JSON.  If the file cannot be masked, it is
printed unchanged with a warning.
)"}},

    {"restore",  //
     {&RestoreCommand,
      R"(restore [file]

Input:
'file' is masked source, '-' or absent for stdin.  --load_map names the
mapping JSON saved by 'sanitize'.

Output: (stdout)
The source with original names, literals and comments put back.  Names that
are not in the mapping are kept.
)"}},

    {"bundle",  //
     {&BundleCommand,
      R"(bundle [file]

Like 'sanitize', but prints a Markdown document for an assistant: a prompt,
the masked code and the mapping table.
)"}},

    {"unbundle",  //
     {&UnbundleCommand,
      R"(unbundle [file]

Input:
'file' is a reply in the 'bundle' layout.  Its code block is restored with
its map table, completed by --load_map if given.  Without a code block the
whole text is taken as code.  It is an error if neither the reply nor
--load_map has any mapping entry.

Output: (stdout)
The restored code.
)"}},
};

}  // namespace

int main(int argc, char *argv[]) {
  deepsan::SubcommandRegistry commands;
  for (const auto &entry : kCommands) {
    const auto status = commands.RegisterCommand(entry.first, entry.second);
    if (!status.ok()) {
      std::cerr << status.message() << std::endl;
      return 2;
    }
  }

  const std::string usage = absl::StrCat("usage: ", argv[0],
                                         " command [options] [file]\n"
                                         "available commands:\n",
                                         commands.ListCommands());

  const auto args = deepsan::InitCommandLine(usage, &argc, &argv);
  if (args.size() == 1) {
    std::cerr << absl::ProgramUsageMessage() << std::endl;
    return 1;
  }
  // args[0] is the program name, args[1] the subcommand.
  const SubcommandArgsRange command_args(args.data() + 2, args.size() - 2);

  const auto status =
      commands.Run(args[1], command_args, std::cout, std::cerr);
  if (!status.ok()) {
    std::cerr << status.message() << std::endl;
    return 1;
  }
  return 0;
}
