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

#include "deepsan/common/strings/quote-utils.h"

#include <cstddef>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"

namespace deepsan {

static bool IsQuoteChar(char c) { return c == '"' || c == '\'' || c == '`'; }

bool QuotedParts::IsSimplyQuoted() const {
  return head.size() == 1 && (head[0] == '"' || head[0] == '\'');
}

QuotedParts SplitQuoted(absl::string_view text) {
  const QuotedParts unsplit{text.substr(0, 0), text,
                            text.substr(text.length())};
  size_t prefix = 0;
  while (prefix < text.length() && prefix < 2 &&
         absl::ascii_isalpha(text[prefix])) {
    ++prefix;
  }
  if (prefix >= text.length() || !IsQuoteChar(text[prefix])) return unsplit;

  const char quote = text[prefix];
  size_t delimiter = 1;
  const absl::string_view quoted = text.substr(prefix);
  if (quote != '`' && quoted.length() >= 6 &&
      quoted.find_first_not_of(quote) >= 3 &&
      absl::EndsWith(quoted.substr(3), quoted.substr(0, 3))) {
    delimiter = 3;
  }
  const size_t head_length = prefix + delimiter;
  if (text.length() < head_length + delimiter) return unsplit;
  const absl::string_view tail = text.substr(text.length() - delimiter);
  if (tail != text.substr(prefix, delimiter)) return unsplit;
  return {text.substr(0, head_length),
          text.substr(head_length, text.length() - head_length - delimiter),
          tail};
}

}  // namespace deepsan
