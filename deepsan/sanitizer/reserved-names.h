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

#ifndef DEEPSAN_SANITIZER_RESERVED_NAMES_H_
#define DEEPSAN_SANITIZER_RESERVED_NAMES_H_

#include <cstddef>
#include <iosfwd>
#include <set>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "deepsan/common/strings/compare.h"

namespace deepsan {

// How a user whitelist combines with the built-in reserved names.
enum class WhitelistMode {
  kAppend,     // defaults plus whitelist
  kOverwrite,  // whitelist only
};

std::ostream &operator<<(std::ostream &, WhitelistMode);

// Accepts "append" and "overwrite".
absl::StatusOr<WhitelistMode> ParseWhitelistMode(absl::string_view text);

// Names that are never masked by default: language built-ins, common
// library globals, React hooks and lifecycle methods, Python built-ins and
// dunder names, and contextual keywords that lex as identifiers.
absl::Span<const absl::string_view> DefaultReservedNames();

// The set of names exempt from masking for one sanitize call.
class ReservedSet {
 public:
  ReservedSet(const std::vector<std::string> &whitelist, WhitelistMode mode);

  bool Contains(absl::string_view name) const {
    return names_.find(name) != names_.end();
  }

  size_t size() const { return names_.size(); }

 private:
  std::set<std::string, StringViewCompare> names_;
};

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_RESERVED_NAMES_H_
