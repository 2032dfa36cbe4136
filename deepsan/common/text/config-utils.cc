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

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"
#include "re2/re2.h"

namespace deepsan {
using absl::string_view;
using config::NVConfigSpec;

absl::Status ParseNameValues(string_view config_string,
                             const std::initializer_list<NVConfigSpec> &spec) {
  for (const string_view single_config :
       absl::StrSplit(config_string, absl::ByAnyChar(";\n"),
                      absl::SkipWhitespace())) {
    const std::pair<string_view, string_view> nv_pair =
        absl::StrSplit(single_config, absl::MaxSplits(':', 1));
    const string_view name = absl::StripAsciiWhitespace(nv_pair.first);
    const string_view value = absl::StripAsciiWhitespace(nv_pair.second);
    const auto value_config = std::find_if(
        spec.begin(), spec.end(),
        [name](const NVConfigSpec &s) { return name == s.name; });
    if (value_config == spec.end()) {
      std::vector<string_view> available;
      for (const auto &s : spec) available.emplace_back(s.name);
      return absl::InvalidArgumentError(
          absl::StrCat(name, ": unknown parameter; supported ",
                       (available.size() > 1 ? "parameters are '"
                                             : "parameter is '"),
                       absl::StrJoin(available, "', '"), "'"));
    }
    if (!value_config->set_value) continue;  // accepted, but ignored.
    const absl::Status result = value_config->set_value(value);
    if (!result.ok()) {
      // The setter only knows the value; prefix the parameter name.
      return absl::InvalidArgumentError(
          absl::StrCat(name, ": ", result.message()));
    }
  }
  return absl::OkStatus();
}

namespace config {

ConfigValueSetter SetInt(int *value, int minimum, int maximum) {
  CHECK(value) << "Must provide pointer to integer to store.";
  return [value, minimum, maximum](string_view v) {
    int parsed_value;
    if (!absl::SimpleAtoi(v, &parsed_value)) {
      return absl::InvalidArgumentError(
          absl::StrCat("'", v, "': cannot parse integer"));
    }
    if (parsed_value < minimum || parsed_value > maximum) {
      return absl::InvalidArgumentError(absl::StrCat(
          parsed_value, " out of range [", minimum, "...", maximum, "]"));
    }
    *value = parsed_value;
    return absl::OkStatus();
  };
}

ConfigValueSetter SetBool(bool *value) {
  CHECK(value) << "Must provide pointer to boolean to store.";
  return [value](string_view v) {
    // clang-format off
    if (v.empty() || v == "1"
        || absl::EqualsIgnoreCase(v, "true")
        || absl::EqualsIgnoreCase(v, "on")) {
      *value = true;
      return absl::OkStatus();
    }
    if (v == "0"
        || absl::EqualsIgnoreCase(v, "false")
        || absl::EqualsIgnoreCase(v, "off")) {
      *value = false;
      return absl::OkStatus();
    }
    // clang-format on
    return absl::InvalidArgumentError(
        absl::StrCat("'", v,
                     "': boolean value should be one of 'true', 'on' or "
                     "'false', 'off'"));
  };
}

ConfigValueSetter SetString(std::string *value) {
  CHECK(value) << "Must provide pointer to string to store.";
  return [value](string_view v) {
    value->assign(v.data(), v.length());
    return absl::OkStatus();
  };
}

ConfigValueSetter SetStringOneOf(std::string *value,
                                 const std::vector<string_view> &allowed) {
  CHECK(value) << "Must provide pointer to string to store.";
  return [value, allowed](string_view v) {
    if (std::find(allowed.begin(), allowed.end(), v) == allowed.end()) {
      if (allowed.size() == 1) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Value can only be '", allowed[0], "'; got '", v, "'"));
      }
      return absl::InvalidArgumentError(
          absl::StrCat("Value can only be one of ['",
                       absl::StrJoin(allowed, "', '"), "']; got '", v, "'"));
    }
    value->assign(v.data(), v.length());
    return absl::OkStatus();
  };
}

ConfigValueSetter SetStringList(std::vector<std::string> *values) {
  CHECK(values) << "Must provide pointer to vector to store.";
  return [values](string_view v) {
    for (const string_view item : absl::StrSplit(v, ',', absl::SkipWhitespace())) {
      values->emplace_back(absl::StripAsciiWhitespace(item));
    }
    return absl::OkStatus();
  };
}

ConfigValueSetter SetRegex(std::unique_ptr<re2::RE2> *regex) {
  CHECK(regex) << "Must provide pointer to a RE2 to store.";
  return [regex](string_view v) {
    auto compiled = std::make_unique<re2::RE2>(
        re2::StringPiece(v.data(), v.size()), re2::RE2::Quiet);
    if (!compiled->ok()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Failed to parse regular expression: ", compiled->error()));
    }
    *regex = std::move(compiled);
    return absl::OkStatus();
  };
}

}  // namespace config
}  // namespace deepsan
