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

#ifndef DEEPSAN_SANITIZER_SANITIZE_OPTIONS_H_
#define DEEPSAN_SANITIZER_SANITIZE_OPTIONS_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "deepsan/sanitizer/category.h"
#include "deepsan/sanitizer/reserved-names.h"
#include "re2/re2.h"

namespace deepsan {

struct SanitizeOptions {
  bool mask_vars = true;
  bool mask_funcs = true;
  // Covers classes and types.
  bool mask_classes = true;
  bool mask_strings = false;
  bool remove_comments = false;

  std::vector<std::string> whitelist;
  WhitelistMode whitelist_mode = WhitelistMode::kAppend;

  // Shorter names are never masked.
  int min_name_length = 2;

  // Names this matches (partially) are never masked.  Shared so that
  // options stay copyable.
  std::shared_ptr<const re2::RE2> keep_pattern;

  bool CategoryEnabled(Category category) const;
};

// Updates "options" from a "name:value;name:value" string, e.g.
//   "maskStrings:on;removeComments:on;whitelist:apiClient,CONFIG"
// Accepted names:
//   maskVariables (alias maskVars), maskFunctions (alias maskFuncs),
//   maskClasses, maskStrings, removeComments: boolean
//   whitelist: comma-separated names, appended to the current list
//   whitelistMode: append | overwrite
//   minNameLength: 1 to 64
//   keepPattern: regular expression
//   copyToClipboard: accepted and ignored
// Leaves "options" unchanged on error.
absl::Status ParseSanitizeOptions(absl::string_view config_string,
                                  SanitizeOptions *options);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_SANITIZE_OPTIONS_H_
