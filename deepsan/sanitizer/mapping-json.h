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

#ifndef DEEPSAN_SANITIZER_MAPPING_JSON_H_
#define DEEPSAN_SANITIZER_MAPPING_JSON_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "nlohmann/json.hpp"

namespace deepsan {

// Mapping as a flat JSON object of strings.
nlohmann::json ToJson(const Mapping &mapping);

// Mapping as JSON text, indented by two spaces, keys sorted.  JSON text is
// UTF-8, so an entry that isn't (a comment in a Latin-1 source, say) is
// InvalidArgument.
absl::StatusOr<std::string> MappingToJson(const Mapping &mapping);

// Parses a flat JSON object of strings.  Anything else, including a
// non-string value, is InvalidArgument.
absl::StatusOr<Mapping> ParseMappingJson(absl::string_view json_text);

}  // namespace deepsan

#endif  // DEEPSAN_SANITIZER_MAPPING_JSON_H_
