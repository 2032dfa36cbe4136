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

#include "deepsan/common/text/replacement-edit.h"

#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"

namespace deepsan {

bool EditSet::Add(ReplacementEdit edit) {
  return edits_.insert(std::move(edit)).second;
}

std::string EditSet::Apply(absl::string_view base) const {
  size_t result_size = base.size();
  for (const auto &edit : edits_) {
    result_size += edit.replacement.size();
    result_size -= edit.fragment.size();
  }
  std::string result;
  result.reserve(result_size);

  auto prev_start = base.begin();
  for (const auto &edit : edits_) {
    CHECK_LE(base.begin(), edit.fragment.begin());
    CHECK_GE(base.end(), edit.fragment.end());
    result.append(prev_start, edit.fragment.begin());
    result.append(edit.replacement);
    prev_start = edit.fragment.end();
  }
  result.append(prev_start, base.end());
  VLOG(2) << "Applied " << edits_.size() << " edits, " << base.size()
          << " -> " << result.size() << " bytes";
  return result;
}

}  // namespace deepsan
