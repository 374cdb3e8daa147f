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

#ifndef PROCJAIL_TESTING_H_
#define PROCJAIL_TESTING_H_

#include <string>

#include "gmock/gmock.h"  // IWYU pragma: keep
#include "gtest/gtest.h"  // IWYU pragma: keep
#include "absl/strings/string_view.h"
#include "procjail/config.h"  // IWYU pragma: export
#include "procjail/util/status_matchers.h"  // IWYU pragma: export

// The macro SKIP_UNLESS_LINUX can be used in tests that exercise Linux-only
// isolation tools.
#define SKIP_UNLESS_LINUX                                   \
  do {                                                      \
    if (!::procjail::host_os::IsLinux()) {                  \
      GTEST_SKIP() << "Requires a Linux host";              \
    }                                                       \
  } while (0)

namespace procjail {

// Returns a writable path usable in tests. If the name argument is specified,
// returns a name under that path. This can then be used for creating temporary
// test files and/or directories.
std::string GetTestTempPath(absl::string_view name = {});

// Returns a fresh, empty directory under GetTestTempPath().
std::string MakeTestScratchRoot(absl::string_view name);

}  // namespace procjail

#endif  // PROCJAIL_TESTING_H_
