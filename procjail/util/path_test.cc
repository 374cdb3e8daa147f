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

#include "procjail/util/path.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace procjail {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StrEq;

TEST(PathTest, JoinPath) {
  EXPECT_THAT(file::JoinPath("/tmp", "procjail-ab12"),
              StrEq("/tmp/procjail-ab12"));
  EXPECT_THAT(file::JoinPath("/tmp/", "/home"), StrEq("/tmp/home"));
  EXPECT_THAT(file::JoinPath("", "tmp"), StrEq("tmp"));
  EXPECT_THAT(file::JoinPath("/scratch", "", "home"), StrEq("/scratch/home"));
  EXPECT_THAT(file::JoinPath("/", "workspace"), StrEq("/workspace"));
  EXPECT_THAT(file::JoinPath(), StrEq(""));
}

TEST(PathTest, IsAbsolutePath) {
  EXPECT_TRUE(file::IsAbsolutePath("/usr/bin"));
  EXPECT_FALSE(file::IsAbsolutePath("usr/bin"));
  EXPECT_FALSE(file::IsAbsolutePath(""));
}

TEST(PathTest, SplitPathComponents) {
  EXPECT_THAT(file::SplitPathComponents("/a//b/c/"),
              ElementsAre("a", "b", "c"));
  EXPECT_THAT(file::SplitPathComponents("rel/x"), ElementsAre("rel", "x"));
  EXPECT_THAT(file::SplitPathComponents("/"), IsEmpty());
}

TEST(PathTest, CleanPath) {
  EXPECT_THAT(file::CleanPath(""), StrEq("."));
  EXPECT_THAT(file::CleanPath("/data/project/"), StrEq("/data/project"));
  EXPECT_THAT(file::CleanPath("//data//project"), StrEq("/data/project"));
  EXPECT_THAT(file::CleanPath("/data/../etc"), StrEq("/etc"));
  EXPECT_THAT(file::CleanPath("/.."), StrEq("/"));
  EXPECT_THAT(file::CleanPath("../../a/b/../c"), StrEq("../../a/c"));
}

}  // namespace
}  // namespace procjail
