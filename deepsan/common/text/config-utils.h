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

#ifndef DEEPSAN_COMMON_TEXT_CONFIG_UTILS_H_
#define DEEPSAN_COMMON_TEXT_CONFIG_UTILS_H_

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "re2/re2.h"

namespace deepsan {
namespace config {
using ConfigValueSetter = std::function<absl::Status(absl::string_view)>;

struct NVConfigSpec {
  const char *name;
  ConfigValueSetter set_value;
};
}  // namespace config

// Parses name:value pairs separated by ';' or newline, and hands each value
// to the setter registered under its name in "spec".
// Whitespace around names and values is ignored, so
//   "maskStrings: on; whitelistMode: overwrite"
// is a valid string.
//
// Sample call:
//   return ParseNameValues(text, {{"maskStrings", SetBool(&mask_strings)},
//                                 {"whitelist", SetStringList(&names)}});
//
// Returns an error naming the parameter for an unknown name or for a value
// its setter rejects.
absl::Status ParseNameValues(
    absl::string_view config_string,
    const std::initializer_list<config::NVConfigSpec> &spec);

namespace config {

// Parses a decimal integer within [minimum, maximum].
ConfigValueSetter SetInt(int *value, int minimum, int maximum);

// Accepts 1/0, true/false and on/off (case-insensitive).  An empty value
// means true.
ConfigValueSetter SetBool(bool *value);

ConfigValueSetter SetString(std::string *value);

// Set a string, but verify that it is only one of a limited set.  The set is
// a vector so that the error message lists it in the caller's order.
ConfigValueSetter SetStringOneOf(std::string *value,
                                 const std::vector<absl::string_view> &allowed);

// Appends the ','-separated, whitespace-trimmed, non-empty items.
ConfigValueSetter SetStringList(std::vector<std::string> *values);

// Compiles the value into a regular expression.
ConfigValueSetter SetRegex(std::unique_ptr<re2::RE2> *regex);

}  // namespace config
}  // namespace deepsan

#endif  // DEEPSAN_COMMON_TEXT_CONFIG_UTILS_H_
