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

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "procjail/testing.h"
#include "procjail/util/file_helpers.h"
#include "procjail/util/path.h"
#include "procjail/util/status_matchers.h"

namespace procjail::file_util {
namespace {

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Ne;
using ::testing::StrEq;
using ::testing::UnorderedElementsAre;

TEST(FDCloserTest, ClosesOnDestruction) {
  int fds[2];
  ASSERT_THAT(pipe(fds), Eq(0));
  {
    fileops::FDCloser read_end(fds[0]);
    fileops::FDCloser write_end(fds[1]);
    EXPECT_THAT(read_end.get(), Eq(fds[0]));
  }
  EXPECT_THAT(fcntl(fds[0], F_GETFD), Eq(-1));
  EXPECT_THAT(fcntl(fds[1], F_GETFD), Eq(-1));
}

TEST(FDCloserTest, ReleaseKeepsDescriptorOpen) {
  int fds[2];
  ASSERT_THAT(pipe(fds), Eq(0));
  fileops::FDCloser write_end(fds[1]);
  {
    fileops::FDCloser read_end(fds[0]);
    EXPECT_THAT(read_end.Release(), Eq(fds[0]));
    EXPECT_THAT(read_end.Close(), IsFalse());
  }
  EXPECT_THAT(fcntl(fds[0], F_GETFD), Ne(-1));
  close(fds[0]);
}

TEST(FileOpsTest, Basename) {
  EXPECT_THAT(fileops::Basename("/usr/bin/podman"), StrEq("podman"));
  EXPECT_THAT(fileops::Basename("bwrap"), StrEq("bwrap"));
  EXPECT_THAT(fileops::Basename("/tmp/"), StrEq(""));
}

TEST(FileOpsTest, CreateDirectoriesAndDeleteRecursively) {
  const std::string root = MakeTestScratchRoot("fileops");
  const std::string nested = file::JoinPath(root, "a", "b", "c");

  ASSERT_THAT(fileops::CreateDirectories(nested, 0700), IsOk());
  EXPECT_THAT(fileops::IsDirectory(nested), IsTrue());
  // Creating it again is fine.
  EXPECT_THAT(fileops::CreateDirectories(nested, 0700), IsOk());

  ASSERT_THAT(file::SetContents(file::JoinPath(root, "a", "f1"), "x"), IsOk());
  ASSERT_THAT(file::SetContents(file::JoinPath(nested, "f2"), "y"), IsOk());
  ASSERT_THAT(symlink("/nonexistent", file::JoinPath(root, "a", "l").c_str()),
              Eq(0));

  absl::StatusOr<std::vector<std::string>> entries =
      fileops::ListDirectoryEntries(file::JoinPath(root, "a"));
  ASSERT_THAT(entries, IsOk());
  EXPECT_THAT(*entries, UnorderedElementsAre("b", "f1", "l"));

  EXPECT_THAT(fileops::DeleteRecursively(root), IsOk());
  EXPECT_THAT(fileops::Exists(root, false), IsFalse());
  // Deleting something that is already gone succeeds.
  EXPECT_THAT(fileops::DeleteRecursively(root), IsOk());
}

TEST(FileOpsTest, CreateDirectoriesOverFile) {
  const std::string root = MakeTestScratchRoot("fileops_file");
  const std::string path = file::JoinPath(root, "file");
  ASSERT_THAT(file::SetContents(path, "content"), IsOk());
  EXPECT_THAT(fileops::CreateDirectories(path, 0700),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(fileops::DeleteRecursively(root), IsOk());
}

TEST(FileOpsTest, RealPath) {
  const std::string root = MakeTestScratchRoot("fileops_realpath");
  ASSERT_THAT(fileops::CreateDirectories(file::JoinPath(root, "dir"), 0700),
              IsOk());
  const std::string link = file::JoinPath(root, "link");
  ASSERT_THAT(symlink(file::JoinPath(root, "dir").c_str(), link.c_str()),
              Eq(0));

  absl::StatusOr<std::string> resolved = fileops::RealPath(link);
  ASSERT_THAT(resolved, IsOk());
  absl::StatusOr<std::string> expected =
      fileops::RealPath(file::JoinPath(root, "dir"));
  ASSERT_THAT(expected, IsOk());
  EXPECT_THAT(*resolved, StrEq(*expected));

  EXPECT_THAT(fileops::RealPath(file::JoinPath(root, "missing")),
              StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(fileops::DeleteRecursively(root), IsOk());
}

TEST(FileOpsTest, WriteToFD) {
  int fds[2];
  ASSERT_THAT(pipe(fds), Eq(0));
  fileops::FDCloser read_end(fds[0]);
  fileops::FDCloser write_end(fds[1]);
  constexpr char kData[] = "policy";
  ASSERT_THAT(fileops::WriteToFD(write_end.get(), kData, sizeof(kData) - 1),
              IsTrue());
  write_end.Close();
  char buf[16] = {};
  EXPECT_THAT(read(read_end.get(), buf, sizeof(buf)), Eq(sizeof(kData) - 1));
  EXPECT_THAT(std::string(buf), StrEq("policy"));
}

}  // namespace
}  // namespace procjail::file_util
