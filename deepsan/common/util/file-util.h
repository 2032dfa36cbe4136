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

// Filesystem helpers used by the command line tool.
#ifndef DEEPSAN_COMMON_UTIL_FILE_UTIL_H_
#define DEEPSAN_COMMON_UTIL_FILE_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace deepsan {
namespace file {

// Convention: "-" names stdin.
bool IsStdin(absl::string_view filename);

// Returns the part of the path after the final "/".  If there is no
// "/" in the path, the result is the same as the input.
absl::string_view Basename(absl::string_view filename);

// Returns the extension of the basename including the leading ".", or an
// empty string if there is none.
absl::string_view Extension(absl::string_view filename);

// Determines whether the given filename exists and is a regular file or pipe.
absl::Status FileExists(const std::string &filename);

// Reads file "filename" (or stdin for "-") and returns its content.
absl::StatusOr<std::string> GetContentAsString(absl::string_view filename);

// Creates file "filename" and stores the given content in it.
absl::Status SetContents(absl::string_view filename, absl::string_view content);

namespace testing {

// A temporary file with a randomly generated name, pre-populated with
// content, and deleted when the instance goes out of scope.
class ScopedTestFile {
 public:
  ScopedTestFile(absl::string_view base_dir, absl::string_view content);
  ~ScopedTestFile();

  ScopedTestFile(const ScopedTestFile &) = delete;
  ScopedTestFile &operator=(const ScopedTestFile &) = delete;

  const std::string &filename() const { return filename_; }

 private:
  std::string filename_;
};

}  // namespace testing
}  // namespace file
}  // namespace deepsan

#endif  // DEEPSAN_COMMON_UTIL_FILE_UTIL_H_
