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

#include "procjail/util/file_helpers.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "procjail/util/fileops.h"

namespace procjail::file {

absl::Status GetContents(absl::string_view path, std::string* output) {
  std::ifstream in_stream{std::string(path), std::ios_base::binary};
  std::ostringstream out_stream;
  out_stream << in_stream.rdbuf();
  if (!in_stream || !out_stream) {
    return absl::UnknownError(absl::StrCat("Error during read: ", path));
  }
  *output = out_stream.str();
  return absl::OkStatus();
}

absl::Status SetContents(absl::string_view path, absl::string_view content,
                         int mode) {
  const std::string filename(path);
  file_util::fileops::FDCloser fd(
      open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
  if (fd.get() == -1) {
    return absl::ErrnoToStatus(errno, absl::StrCat("open(", path, ")"));
  }
  if (!file_util::fileops::WriteToFD(fd.get(), content.data(),
                                     content.size())) {
    return absl::ErrnoToStatus(errno, absl::StrCat("write(", path, ")"));
  }
  if (!fd.Close()) {
    return absl::ErrnoToStatus(errno, absl::StrCat("close(", path, ")"));
  }
  return absl::OkStatus();
}

}  // namespace procjail::file
