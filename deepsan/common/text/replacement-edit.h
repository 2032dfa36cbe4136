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

#ifndef DEEPSAN_COMMON_TEXT_REPLACEMENT_EDIT_H_
#define DEEPSAN_COMMON_TEXT_REPLACEMENT_EDIT_H_

#include <cstddef>
#include <set>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "deepsan/common/text/token-info.h"

namespace deepsan {

// Replaces one fragment of a text buffer.  The fragment is a substring of
// the buffer the edit is later applied to.
struct ReplacementEdit {
  ReplacementEdit(absl::string_view fragment, std::string replacement)
      : fragment(fragment), replacement(std::move(replacement)) {}

  ReplacementEdit(const TokenInfo &token, std::string replacement)
      : fragment(token.text()), replacement(std::move(replacement)) {}

  // Orders by position.  Overlapping fragments compare equivalent, which is
  // how EditSet detects conflicts.
  bool operator<(const ReplacementEdit &other) const {
    return (fragment.data() + fragment.size()) <= other.fragment.data();
  }

  absl::string_view fragment;
  std::string replacement;
};

// Ordered set of non-overlapping edits over one buffer.
class EditSet {
 public:
  EditSet() = default;

  // Returns false and leaves the set unchanged if the edit overlaps one
  // already present.
  bool Add(ReplacementEdit edit);

  bool empty() const { return edits_.empty(); }
  size_t size() const { return edits_.size(); }
  const std::set<ReplacementEdit> &Edits() const { return edits_; }

  // Copies "base" into a new string, substituting every edit.  All fragments
  // must lie inside "base".
  std::string Apply(absl::string_view base) const;

 private:
  std::set<ReplacementEdit> edits_;
};

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_TEXT_REPLACEMENT_EDIT_H_
