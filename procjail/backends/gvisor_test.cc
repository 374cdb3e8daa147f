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

#include "procjail/backends/gvisor.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/policybuilder.h"
#include "procjail/testing.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsTrue;
using ::testing::Not;
using ::testing::StrEq;

ExecutionRequest MakeRequest() {
  ExecutionRequest request;
  request.command = "echo";
  request.args = {"hello"};
  return request;
}

TEST(GVisorTest, NetworkNone) {
  EXPECT_THAT(BuildRunscArgs(PolicyBuilder().BuildOrDie(), MakeRequest(),
                             "runsc", "/work"),
              ElementsAre("runsc", "--rootless", "--network=none",
                          "--ignore-cgroups", "do", "--cwd=/work", "--",
                          "echo", "hello"));
}

TEST(GVisorTest, NetworkModes) {
  EXPECT_THAT(
      BuildRunscArgs(
          PolicyBuilder().SetNetwork(NetworkMode::kHost).BuildOrDie(),
          MakeRequest(), "runsc", "/work"),
      Contains("--network=host"));
  EXPECT_THAT(
      BuildRunscArgs(
          PolicyBuilder().SetNetwork(NetworkMode::kRestricted).BuildOrDie(),
          MakeRequest(), "runsc", "/work"),
      Contains("--network=sandbox"));
}

TEST(GVisorTest, NoWorkDir) {
  EXPECT_THAT(BuildRunscArgs(PolicyBuilder().BuildOrDie(), MakeRequest(),
                             "runsc", ""),
              Not(Contains(HasSubstr("--cwd"))));
}

TEST(GVisorTest, RunsCommand) {
  SKIP_UNLESS_LINUX;
  if (!GVisorSandbox::IsAvailable()) {
    GTEST_SKIP() << "runsc is not installed";
  }
  GVisorSandbox sandbox(PolicyBuilder().BuildOrDie());
  ExecutionResult result = sandbox.Execute(MakeRequest());
  sandbox.Cleanup().IgnoreError();
  if (!result.success) {
    GTEST_SKIP() << "runsc cannot run rootless here: " << result.ToString();
  }
  EXPECT_THAT(result.stdout_data, StrEq("hello\n"));
  EXPECT_THAT(result.success, IsTrue());
}

}  // namespace
}  // namespace procjail
