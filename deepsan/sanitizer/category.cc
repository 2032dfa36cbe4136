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

#include "deepsan/sanitizer/category.h"

#include <ostream>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace deepsan {

static constexpr absl::string_view kCaptureNamespace = "def.";

static constexpr Category kAllCategories[] = {
    Category::kVariable,
    Category::kFunction,
    Category::kClass,
    Category::kType,
};

absl::string_view CategoryName(Category category) {
  switch (category) {
    case Category::kVariable:
      return "var";
    case Category::kFunction:
      return "func";
    case Category::kClass:
      return "class";
    case Category::kType:
      return "type";
  }
  return "???";
}

std::ostream &operator<<(std::ostream &stream, Category category) {
  return stream << CategoryName(category);
}

absl::StatusOr<Category> CategoryFromCaptureName(absl::string_view capture) {
  absl::string_view name = capture;
  if (absl::ConsumePrefix(&name, kCaptureNamespace)) {
    for (const Category category : kAllCategories) {
      if (name == CategoryName(category)) return category;
    }
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown definition capture \"@", capture,
                   "\"; expected one of @def.var, @def.func, @def.class, "
                   "@def.type"));
}

}  // namespace deepsan
