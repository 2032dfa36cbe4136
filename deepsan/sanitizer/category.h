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

#ifndef DEEPSAN_SANITIZER_CATEGORY_H_
#define DEEPSAN_SANITIZER_CATEGORY_H_

#include <iosfwd>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace deepsan {

// Kind of a defined name.  Drives the base prefix of its masked name and
// which sanitize option enables it.
enum class Category {
  kVariable,
  kFunction,
  kClass,
  kType,
};

// "var", "func", "class" or "type".
absl::string_view CategoryName(Category category);

std::ostream &operator<<(std::ostream &, Category);

// Maps a definition query capture name ("def.var", "def.func", "def.class",
// "def.type") to its category.
absl::StatusOr<Category> CategoryFromCaptureName(absl::string_view capture);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_CATEGORY_H_
