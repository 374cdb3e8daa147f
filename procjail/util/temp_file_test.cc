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

#include "procjail/util/temp_file.h"

#include <cstdlib>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/match.h"
#include "procjail/testing.h"
#include "procjail/util/fileops.h"
#include "procjail/util/path.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::Not;
using ::testing::StartsWith;

TEST(TempFileTest, CreateTempDirIsUnique) {
  const std::string prefix = GetTestTempPath("temp_file_test_");
  PROCJAIL_ASSERT_OK_AND_ASSIGN(std::string first, CreateTempDir(prefix));
  PROCJAIL_ASSERT_OK_AND_ASSIGN(std::string second, CreateTempDir(prefix));
  EXPECT_THAT(first, StartsWith(prefix));
  EXPECT_THAT(first, Ne(second));
  EXPECT_THAT(file_util::fileops::IsDirectory(first), IsTrue());
  EXPECT_THAT(file_util::fileops::DeleteRecursively(first), IsOk());
  EXPECT_THAT(file_util::fileops::DeleteRecursively(second), IsOk());
}

TEST(TempFileTest, CreateTempDirInMissingParentFails) {
  EXPECT_THAT(CreateTempDir("/nonexistent-procjail-parent/dir_"), Not(IsOk()));
}

TEST(TempFileTest, SystemTempDirIsAbsolute) {
  EXPECT_THAT(file::IsAbsolutePath(GetSystemTempDir()), IsTrue());
  EXPECT_FALSE(absl::EndsWith(GetSystemTempDir(), "/") &&
               GetSystemTempDir() != "/");
}

}  // namespace
}  // namespace procjail
