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

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/text/config-utils.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/common/util/status-macros.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "re2/re2.h"

namespace deepsan {

bool SanitizeOptions::CategoryEnabled(Category category) const {
  switch (category) {
    case Category::kVariable:
      return mask_vars;
    case Category::kFunction:
      return mask_funcs;
    case Category::kClass:
    case Category::kType:
      return mask_classes;
  }
  return false;
}

absl::Status ParseSanitizeOptions(absl::string_view config_string,
                                  SanitizeOptions *options) {
  SanitizeOptions result = *options;
  std::string whitelist_mode;
  std::unique_ptr<re2::RE2> keep_pattern;
  RETURN_IF_ERROR(ParseNameValues(
      config_string,
      {
          {"maskVariables", config::SetBool(&result.mask_vars)},
          {"maskVars", config::SetBool(&result.mask_vars)},
          {"maskFunctions", config::SetBool(&result.mask_funcs)},
          {"maskFuncs", config::SetBool(&result.mask_funcs)},
          {"maskClasses", config::SetBool(&result.mask_classes)},
          {"maskStrings", config::SetBool(&result.mask_strings)},
          {"removeComments", config::SetBool(&result.remove_comments)},
          {"whitelist", config::SetStringList(&result.whitelist)},
          {"whitelistMode",
           config::SetStringOneOf(&whitelist_mode, {"append", "overwrite"})},
          {"minNameLength", config::SetInt(&result.min_name_length, 1, 64)},
          {"keepPattern", config::SetRegex(&keep_pattern)},
          {"copyToClipboard", nullptr},
      }));
  if (!whitelist_mode.empty()) {
    const auto mode = ParseWhitelistMode(whitelist_mode);
    CHECK(mode.ok()) << mode.status();  // Restricted by SetStringOneOf().
    result.whitelist_mode = *mode;
  }
  if (keep_pattern != nullptr) result.keep_pattern = std::move(keep_pattern);
  *options = std::move(result);
  VLOG(1) << "Sanitize options: vars=" << options->mask_vars
          << " funcs=" << options->mask_funcs
          << " classes=" << options->mask_classes
          << " strings=" << options->mask_strings
          << " comments=" << options->remove_comments
          << " whitelist=" << options->whitelist.size() << " ("
          << options->whitelist_mode << ")";
  return absl::OkStatus();
}

}  // namespace deepsan
