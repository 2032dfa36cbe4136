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

#ifndef DEEPSAN_COMMON_UTIL_LOGGING_H_
#define DEEPSAN_COMMON_UTIL_LOGGING_H_

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif
#include "absl/log/check.h"  // IWYU pragma: export
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include "absl/log/die_if_null.h"  // IWYU pragma: export
#include "absl/log/log.h"          // IWYU pragma: export

// Abseil releases without VLOG get a minimal stand-in, driven by the
// DEEPSAN_VLOG_DETAIL environment variable (see InitCommandLine()).
#ifndef VLOG
#define DEEPSAN_FALLBACK_VLOG 1
namespace deepsan {
extern int global_vlog_level_;
}  // namespace deepsan

#define VLOG_IS_ON(x) (::deepsan::global_vlog_level_ >= (x))
#define VLOG(x) LOG_IF(INFO, VLOG_IS_ON(x))
#endif  // VLOG

#define CHECK_NOTNULL(p) (void)ABSL_DIE_IF_NULL(p)

#endif  // DEEPSAN_COMMON_UTIL_LOGGING_H_
