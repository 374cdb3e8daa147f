// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PROCJAIL_UTIL_FILEOPS_H_
#define PROCJAIL_UTIL_FILEOPS_H_

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace procjail::file_util::fileops {

// RAII helper class to automatically close file descriptors.
class FDCloser {
 public:
  explicit FDCloser(int fd = kCanonicalInvalidFd) : fd_{fd} {}
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    Swap(other);
    other.Close();
    return *this;
  }
  ~FDCloser();

  int get() const { return fd_; }
  bool Close();
  void Swap(FDCloser& other) { std::swap(fd_, other.fd_); }
  int Release();

 private:
  static constexpr int kCanonicalInvalidFd = -1;

  int fd_;
};

// Returns a file's basename, i.e. everything after the last slash. If the
// input path has a trailing slash, the basename is empty.
std::string Basename(absl::string_view path);

// Tests whether filename exists. If fully_resolve is true, then all symlinks
// are resolved to verify the target exists. Otherwise, this function
// verifies only that the file exists. It may still be a symlink with a
// missing target.
bool Exists(const std::string& filename, bool fully_resolve);

// Returns true if path names an existing directory (symlinks resolved).
bool IsDirectory(const std::string& path);

// Lists the basenames of all entries of a directory, skipping "." and "..".
absl::StatusOr<std::vector<std::string>> ListDirectoryEntries(
    const std::string& directory);

// Recursively creates a directory, skipping segments that already exist.
absl::Status CreateDirectories(const std::string& path, mode_t mode);

// Deletes the specified file or directory, including any sub-directories.
// A path which does not exist is not an error.
absl::Status DeleteRecursively(const std::string& filename);

// Resolves all symlinks and relative components of an existing path.
absl::StatusOr<std::string> RealPath(const std::string& path);

// Writes data to a file descriptor. The file descriptor should be blocking.
// Returns true on success.
bool WriteToFD(int fd, const char* data, size_t size);

}  // namespace procjail::file_util::fileops

#endif  // PROCJAIL_UTIL_FILEOPS_H_
