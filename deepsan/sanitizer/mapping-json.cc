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

#include "deepsan/sanitizer/mapping-json.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"
#include "deepsan/sanitizer/mapping-table.h"
#include "nlohmann/json.hpp"

namespace deepsan {

nlohmann::json ToJson(const Mapping &mapping) {
  nlohmann::json json(nlohmann::json::object());
  for (const auto &entry : mapping) {
    json[entry.first] = entry.second;
  }
  return json;
}

absl::StatusOr<std::string> MappingToJson(const Mapping &mapping) {
  try {
    return ToJson(mapping).dump(2);
  } catch (const nlohmann::json::type_error &e) {
    return absl::InvalidArgumentError(
        absl::StrCat("Mapping cannot be written as JSON: ", e.what()));
  }
}

absl::StatusOr<Mapping> ParseMappingJson(absl::string_view json_text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(json_text.begin(), json_text.end());
  } catch (const nlohmann::json::parse_error &e) {
    return absl::InvalidArgumentError(
        absl::StrCat("Mapping is not valid JSON: ", e.what()));
  }
  if (!json.is_object()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Mapping must be a JSON object, got ", json.type_name()));
  }
  Mapping mapping;
  for (const auto &item : json.items()) {
    if (!item.value().is_string()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Mapping value of \"", item.key(), "\" is ",
                       item.value().type_name(), ", expected string"));
    }
    mapping.emplace(item.key(), item.value().get<std::string>());
  }
  VLOG(1) << "Loaded mapping with " << mapping.size() << " entries";
  return mapping;
}

}  // namespace deepsan
