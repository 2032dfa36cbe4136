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

#ifndef DEEPSAN_COMMON_UTIL_ENUM_FLAGS_H_
#define DEEPSAN_COMMON_UTIL_ENUM_FLAGS_H_

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "deepsan/common/strings/compare.h"
#include "deepsan/common/util/bijective-map.h"
#include "deepsan/common/util/logging.h"

namespace deepsan {

namespace internal {
struct EnumCompare {
  template <class E>
  bool operator()(E left, E right) const {
    return static_cast<int>(left) < static_cast<int>(right);
  }
};
}  // namespace internal

// Names for the values of an enum, for parsing and printing, and for using
// the enum as an absl flag.
//
//   // .h
//   enum class Mode { kFast, kSafe };
//   std::ostream &operator<<(std::ostream &stream, Mode mode);
//   bool AbslParseFlag(absl::string_view text, Mode *mode, std::string *error);
//   std::string AbslUnparseFlag(const Mode &mode);
//
//   // .cc
//   static const EnumNameMap<Mode> &ModeNames() {
//     static const EnumNameMap<Mode> kNames({{"fast", Mode::kFast},
//                                            {"safe", Mode::kSafe}});
//     return kNames;
//   }
//   bool AbslParseFlag(absl::string_view text, Mode *mode,
//                      std::string *error) {
//     return ModeNames().Parse(text, mode, error, "mode");
//   }
template <typename EnumType>
class EnumNameMap {
  // Names are string literals and outlive the map.
  using key_type = absl::string_view;

 public:
  // Names and values must both be unique.
  EnumNameMap(std::initializer_list<std::pair<key_type, EnumType>> pairs) {
    for (const auto &pair : pairs) {
      CHECK(enum_name_map_.insert(pair.first, pair.second))
          << "Duplicate enum name or value: " << pair.first;
    }
  }

  EnumNameMap(const EnumNameMap &) = delete;
  EnumNameMap &operator=(const EnumNameMap &) = delete;

  // Prints the names, separated by "sep".
  std::ostream &ListNames(std::ostream &stream, absl::string_view sep) const {
    bool first = true;
    for (const auto &entry : enum_name_map_.forward_view()) {
      if (!first) stream << sep;
      stream << entry.first;
      first = false;
    }
    return stream;
  }

  // Looks up a name.  On failure, appends a message naming the valid
  // choices to "error" and returns false.
  bool Parse(key_type text, EnumType *enum_value, std::string *error,
             absl::string_view type_name) const {
    const EnumType *found_value = enum_name_map_.find_forward(text);
    if (found_value != nullptr) {
      *enum_value = *found_value;
      return true;
    }
    std::ostringstream stream;
    stream << "Invalid " << type_name << ": '" << text
           << "'\nValid options are: ";
    ListNames(stream, ",");
    *error += stream.str();
    return false;
  }

  absl::string_view EnumName(EnumType value) const {
    const auto *key = enum_name_map_.find_reverse(value);
    if (key == nullptr) return "???";
    return *key;
  }

  std::ostream &Unparse(EnumType value, std::ostream &stream) const {
    return stream << EnumName(value);
  }

 private:
  BijectiveMap<key_type, EnumType, StringViewCompare, internal::EnumCompare>
      enum_name_map_;
};

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_UTIL_ENUM_FLAGS_H_
