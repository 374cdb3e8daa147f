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

#include "procjail/testing.h"

#include <cstdlib>
#include <string>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "procjail/util/path.h"
#include "procjail/util/temp_file.h"

namespace procjail {

std::string GetTestTempPath(absl::string_view name) {
  // CTest does not set TEST_TMPDIR, Bazel does.
  const char* test_tmpdir = getenv("TEST_TMPDIR");
  return file::JoinPath(test_tmpdir ? std::string(test_tmpdir)
                                    : GetSystemTempDir(),
                        name);
}

std::string MakeTestScratchRoot(absl::string_view name) {
  absl::StatusOr<std::string> dir =
      CreateTempDir(GetTestTempPath(absl::StrCat(name, "_")));
  CHECK_OK(dir.status());
  return *std::move(dir);
}

}  // namespace procjail
