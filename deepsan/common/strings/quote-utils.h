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

#ifndef DEEPSAN_COMMON_STRINGS_QUOTE_UTILS_H_
#define DEEPSAN_COMMON_STRINGS_QUOTE_UTILS_H_

#include "absl/strings/string_view.h"

namespace deepsan {

// A string literal cut into its opening delimiter (including any prefix
// letters like Python's r/b/f), content and closing delimiter.
struct QuotedParts {
  absl::string_view head;
  absl::string_view body;
  absl::string_view tail;

  // True for a prefix-free literal delimited by one ' or ".
  bool IsSimplyQuoted() const;
};

// Splits a string literal delimited by ', ", `, ''' or """ with an optional
// letter prefix of up to two characters.  Text that is not a complete
// literal comes back whole as the body.
QuotedParts SplitQuoted(absl::string_view text);

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_STRINGS_QUOTE_UTILS_H_
