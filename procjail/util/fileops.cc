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

#include "procjail/util/fileops.h"

#include <dirent.h>    // DIR
#include <limits.h>    // PATH_MAX
#include <stdlib.h>    // realpath
#include <sys/stat.h>  // stat
#include <unistd.h>

#include <cerrno>
#include <memory>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "procjail/util/path.h"

namespace procjail::file_util::fileops {

FDCloser::~FDCloser() { Close(); }

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kCanonicalInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kCanonicalInvalidFd;
  return ret;
}

std::string Basename(absl::string_view path) {
  const auto last_slash = path.find_last_of('/');
  return std::string(last_slash == std::string::npos
                         ? path
                         : absl::ClippedSubstr(path, last_slash + 1));
}

bool Exists(const std::string& filename, bool fully_resolve) {
  struct stat st;
  return (fully_resolve ? stat(filename.c_str(), &st)
                        : lstat(filename.c_str(), &st)) != -1;
}

bool IsDirectory(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

absl::StatusOr<std::vector<std::string>> ListDirectoryEntries(
    const std::string& directory) {
  errno = 0;
  std::unique_ptr<DIR, void (*)(DIR*)> dir{opendir(directory.c_str()),
                                           [](DIR* d) { closedir(d); }};
  if (!dir) {
    return absl::ErrnoToStatus(errno, absl::StrCat("opendir(", directory, ")"));
  }

  std::vector<std::string> entries;
  errno = 0;
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    const std::string name(entry->d_name);
    if (name != "." && name != "..") {
      entries.push_back(name);
    }
  }
  if (errno != 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("readdir(", directory, ")"));
  }
  return entries;
}

absl::Status CreateDirectories(const std::string& path, mode_t mode) {
  if (path.empty()) {
    return absl::InvalidArgumentError("Cannot create a directory at ''");
  }
  std::string current = file::IsAbsolutePath(path) ? "/" : "";
  for (absl::string_view part : file::SplitPathComponents(path)) {
    current = file::JoinPath(current, part);
    if (mkdir(current.c_str(), mode) == 0 || errno == EEXIST) {
      continue;
    }
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(", current, ")"));
  }
  if (!IsDirectory(path)) {
    return absl::FailedPreconditionError(
        absl::StrCat(path, " exists and is not a directory"));
  }
  return absl::OkStatus();
}

absl::Status DeleteRecursively(const std::string& filename) {
  std::vector<std::string> to_delete;
  to_delete.push_back(filename);

  while (!to_delete.empty()) {
    const std::string delfile = to_delete.back();

    struct stat st;
    if (lstat(delfile.c_str(), &st) == -1) {
      if (errno == ENOENT) {
        // Most likely the first file. Either that or someone is deleting the
        // files out from under us.
        to_delete.pop_back();
        continue;
      }
      return absl::ErrnoToStatus(errno, absl::StrCat("lstat(", delfile, ")"));
    }

    if (!S_ISDIR(st.st_mode)) {
      if (unlink(delfile.c_str()) != 0 && errno != ENOENT) {
        return absl::ErrnoToStatus(errno,
                                   absl::StrCat("unlink(", delfile, ")"));
      }
      to_delete.pop_back();
      continue;
    }

    if (rmdir(delfile.c_str()) == 0 || errno == ENOENT) {
      to_delete.pop_back();
      continue;
    }
    if (errno != ENOTEMPTY && errno != EEXIST) {
      return absl::ErrnoToStatus(errno, absl::StrCat("rmdir(", delfile, ")"));
    }
    absl::StatusOr<std::vector<std::string>> entries =
        ListDirectoryEntries(delfile);
    if (!entries.ok()) {
      return entries.status();
    }
    for (const auto& entry : *entries) {
      to_delete.push_back(file::JoinPath(delfile, entry));
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> RealPath(const std::string& path) {
  std::unique_ptr<char, void (*)(char*)> resolved(
      realpath(path.c_str(), nullptr), [](char* p) { free(p); });
  if (!resolved) {
    return absl::ErrnoToStatus(errno, absl::StrCat("realpath(", path, ")"));
  }
  return std::string(resolved.get());
}

bool WriteToFD(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t result = write(fd, data, size);
    if (result < 0 && errno == EINTR) {
      continue;
    }
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

}  // namespace procjail::file_util::fileops
