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

#ifndef DEEPSAN_COMMON_UTIL_STATUS_MACROS_H_
#define DEEPSAN_COMMON_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"

// Evaluates an expression yielding absl::Status and returns it from the
// enclosing function if it is not ok.
//
// Example:
//   RETURN_IF_ERROR(registry.Register("python", ...));
#define RETURN_IF_ERROR(expr)                                                \
  do {                                                                       \
    /* Using _status below to avoid capture problems if expr is "status". */ \
    absl::Status _status = (expr);                                           \
    if (ABSL_PREDICT_FALSE(!_status.ok())) return _status;                   \
  } while (0)

#define DEEPSAN_STATUS_CONCAT_INNER_(a, b) a##b
#define DEEPSAN_STATUS_CONCAT_(a, b) DEEPSAN_STATUS_CONCAT_INNER_(a, b)

#define DEEPSAN_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr)         \
  auto statusor = (rexpr);                                           \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) return statusor.status(); \
  lhs = std::move(*statusor)

// Evaluates an expression yielding absl::StatusOr<T>.  On error, returns the
// status from the enclosing function; otherwise moves the value into lhs.
//
// Example:
//   ASSIGN_OR_RETURN(auto tree, provider->Parse(text));
#define ASSIGN_OR_RETURN(lhs, rexpr) \
  DEEPSAN_ASSIGN_OR_RETURN_IMPL_(    \
      DEEPSAN_STATUS_CONCAT_(_statusor_, __LINE__), lhs, rexpr)

#endif  // DEEPSAN_COMMON_UTIL_STATUS_MACROS_H_
