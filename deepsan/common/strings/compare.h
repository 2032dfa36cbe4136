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

#ifndef DEEPSAN_COMMON_STRINGS_COMPARE_H_
#define DEEPSAN_COMMON_STRINGS_COMPARE_H_

#include "absl/strings/string_view.h"

namespace deepsan {

// Transparent comparator for string-keyed ordered containers, so that
// lookups can be done with a string_view without materializing a string.
//
// Example: std::map<std::string, std::string, StringViewCompare>
struct StringViewCompare {
  using is_transparent = void;

  bool operator()(absl::string_view a, absl::string_view b) const {
    return a < b;
  }
};

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_STRINGS_COMPARE_H_
