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

#ifndef DEEPSAN_COMMON_UTIL_INIT_COMMAND_LINE_H_
#define DEEPSAN_COMMON_UTIL_INIT_COMMAND_LINE_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace deepsan {

// One-line version string of this build.
std::string GetRepositoryVersion();

// Set logging thresholds from environment variables.
//  * DEEPSAN_LOGTHRESHOLD corresponds to absl::LogSeverityAtLeast()
//  * DEEPSAN_VLOG_DETAIL  is the VLOG() verbosity
// Called in InitCommandLine(), so usually not needed to be called separately.
void SetLoggingLevelsFromEnvironment();

// Initializes a command-line tool: usage text, logging, failure signal
// handler and flag parsing.  Recognized flags are removed from the command
// line; the remaining positional parameters are returned, element[0] being
// the program name.
std::vector<absl::string_view> InitCommandLine(absl::string_view usage,
                                               int *argc, char ***argv);

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_UTIL_INIT_COMMAND_LINE_H_
