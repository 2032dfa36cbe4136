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

#include "deepsan/common/util/file-util.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "deepsan/common/util/logging.h"

namespace deepsan {
namespace file {

bool IsStdin(absl::string_view filename) {
  static constexpr absl::string_view kStdinFilename = "-";
  return filename == kStdinFilename;
}

absl::string_view Basename(absl::string_view filename) {
  const auto last_slash_pos = filename.find_last_of('/');
  return last_slash_pos == absl::string_view::npos
             ? filename
             : filename.substr(last_slash_pos + 1);
}

absl::string_view Extension(absl::string_view filename) {
  const absl::string_view base = Basename(filename);
  const auto last_dot_pos = base.find_last_of('.');
  // A leading dot marks a hidden file, not an extension.
  if (last_dot_pos == absl::string_view::npos || last_dot_pos == 0) {
    return base.substr(base.size());
  }
  return base.substr(last_dot_pos);
}

// Builds an error status from errno, prefixed with the filename.
static absl::Status CreateErrorStatusFromErrno(absl::string_view filename,
                                               const char *fallback_msg) {
  const int sys_error = errno;
  const char *const system_msg =
      sys_error == 0 ? fallback_msg : strerror(sys_error);
  if (filename.empty()) filename = "<empty-filename>";
  std::string msg = absl::StrCat(filename, ": ", system_msg);
  switch (sys_error) {
    case EPERM:
    case EACCES:
      return {absl::StatusCode::kPermissionDenied, msg};
    case ENOENT:
      return {absl::StatusCode::kNotFound, msg};
    case EINVAL:
    case EISDIR:
      return {absl::StatusCode::kInvalidArgument, msg};
    default:
      absl::StrAppend(&msg, " (sys_error=", sys_error, ")");
      return {absl::StatusCode::kUnknown, msg};
  }
}

absl::Status FileExists(const std::string &filename) {
  struct stat file_info;
  if (stat(filename.c_str(), &file_info) != 0) {
    return CreateErrorStatusFromErrno(filename, "can't stat");
  }
  if (S_ISREG(file_info.st_mode) || S_ISFIFO(file_info.st_mode)) {
    return absl::OkStatus();
  }
  if (S_ISDIR(file_info.st_mode)) {
    return absl::InvalidArgumentError(
        absl::StrCat(filename, ": is a directory, not a file"));
  }
  return absl::InvalidArgumentError(
      absl::StrCat(filename, ": not a regular file"));
}

absl::StatusOr<std::string> GetContentAsString(absl::string_view filename) {
  std::string content;
  FILE *stream = nullptr;
  if (IsStdin(filename)) {
    stream = stdin;
  } else {
    const std::string filename_str(filename);
    if (absl::Status status = FileExists(filename_str); !status.ok()) {
      return status;
    }
    stream = fopen(filename_str.c_str(), "rb");
  }
  if (!stream) {
    return CreateErrorStatusFromErrno(filename, "can't read");
  }
  char buffer[4096];
  size_t bytes_read;
  do {
    bytes_read = fread(buffer, 1, sizeof(buffer), stream);
    content.append(buffer, bytes_read);
  } while (bytes_read > 0);
  if (stream != stdin) fclose(stream);
  return content;
}

absl::Status SetContents(absl::string_view filename,
                         absl::string_view content) {
  VLOG(1) << __FUNCTION__ << ": Writing file: " << filename;
  FILE *out = fopen(std::string(filename).c_str(), "wb");
  if (!out) return CreateErrorStatusFromErrno(filename, "can't write.");
  const int64_t expected_write = content.size();
  int64_t total_written = 0;
  while (!content.empty()) {
    const size_t w = fwrite(content.data(), 1, content.size(), out);
    if (w == 0) break;
    total_written += w;
    content.remove_prefix(w);
  }
  const bool written_completely = (total_written == expected_write);
  if (fclose(out) != 0 || !written_completely) {
    return CreateErrorStatusFromErrno(filename, "closing.");
  }
  return absl::OkStatus();
}

namespace testing {

ScopedTestFile::ScopedTestFile(absl::string_view base_dir,
                               absl::string_view content)
    : filename_(absl::StrCat(base_dir, "/scoped-file-", getpid(), "-",
                             rand())) {
  const absl::Status status = SetContents(filename_, content);
  CHECK(status.ok()) << status.message();  // ok for test-only code
}

ScopedTestFile::~ScopedTestFile() { unlink(filename_.c_str()); }

}  // namespace testing
}  // namespace file
}  // namespace deepsan
