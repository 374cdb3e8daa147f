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

#include "procjail/backends/container.h"

#include <algorithm>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/flags/flag.h"
#include "absl/flags/reflection.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/flags.h"
#include "procjail/policy.h"
#include "procjail/policybuilder.h"
#include "procjail/util/fileops.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

namespace fileops = ::procjail::file_util::fileops;

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Gt;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Not;
using ::testing::StrEq;

ContainerInvocation MakeInvocation(ContainerRuntime runtime) {
  ContainerInvocation invocation;
  invocation.runtime = runtime;
  invocation.tool_path = std::string(ToolName(runtime));
  invocation.container_name = "procjail-podman-0123456789ab-0";
  invocation.workspace_dir = "/tmp/scratch";
  invocation.image = "alpine:latest";
  invocation.pids_limit = 128;
  invocation.created = absl::FromUnixSeconds(1700000000);
  return invocation;
}

ExecutionRequest MakeRequest() {
  ExecutionRequest request;
  request.command = "echo";
  request.args = {"hello", "world"};
  return request;
}

TEST(ContainerTest, ToolNames) {
  EXPECT_THAT(ToolName(ContainerRuntime::kPodman), StrEq("podman"));
  EXPECT_THAT(ToolName(ContainerRuntime::kDocker), StrEq("docker"));
}

TEST(ContainerTest, DefaultPolicyIsLockedDown) {
  const Policy policy = PolicyBuilder().BuildOrDie();
  std::vector<std::string> args =
      BuildContainerArgs(policy, MakeRequest(),
                         MakeInvocation(ContainerRuntime::kPodman));

  EXPECT_THAT(args, ElementsAre(
                        "podman", "run", "--rm",
                        "--name=procjail-podman-0123456789ab-0",
                        "--memory=268435456", "--cpus=0.5", "--pids-limit=128",
                        "--security-opt=no-new-privileges", "--cap-drop=ALL",
                        "--label=procjail", "--label=procjail.created=1700000000",
                        "--userns=keep-id", "--network=none", "--read-only",
                        "--tmpfs=/tmp:rw,noexec,nosuid,size=64m",
                        "--workdir=/workspace",
                        "--volume=/tmp/scratch:/workspace:Z", "-i",
                        "alpine:latest", "echo", "hello", "world"));
}

TEST(ContainerTest, HardeningAppliesToWritablePolicies) {
  const Policy policy = PolicyBuilder()
                            .SetReadOnly(false)
                            .SetNetwork(NetworkMode::kHost)
                            .BuildOrDie();
  std::vector<std::string> args =
      BuildContainerArgs(policy, MakeRequest(),
                         MakeInvocation(ContainerRuntime::kDocker));

  EXPECT_THAT(args, Contains("--cap-drop=ALL"));
  EXPECT_THAT(args, Contains("--security-opt=no-new-privileges"));
  EXPECT_THAT(args, Contains("--network=host"));
  EXPECT_THAT(args, Not(Contains("--read-only")));
  EXPECT_THAT(args, Not(Contains("--userns=keep-id")));
}

TEST(ContainerTest, RestrictedNetworkApproximation) {
  const Policy policy = PolicyBuilder()
                            .SetNetwork(NetworkMode::kRestricted)
                            .AddAllowedHost("example.com")
                            .BuildOrDie();
  EXPECT_THAT(BuildContainerArgs(policy, MakeRequest(),
                                 MakeInvocation(ContainerRuntime::kPodman)),
              Contains("--network=slirp4netns"));
  EXPECT_THAT(BuildContainerArgs(policy, MakeRequest(),
                                 MakeInvocation(ContainerRuntime::kDocker)),
              Contains("--network=bridge"));
}

TEST(ContainerTest, AllowedPathsAreMountedReadOnly) {
  const Policy policy = PolicyBuilder()
                            .SetReadOnly(false)
                            .AddAllowedPath("/srv/data")
                            .AddAllowedPath("/opt/tools")
                            .BuildOrDie();
  std::vector<std::string> args =
      BuildContainerArgs(policy, MakeRequest(),
                         MakeInvocation(ContainerRuntime::kPodman));
  EXPECT_THAT(args, Contains("--volume=/srv/data:/srv/data:ro"));
  EXPECT_THAT(args, Contains("--volume=/opt/tools:/opt/tools:ro"));
}

TEST(ContainerTest, EnvironmentAndWorkDir) {
  const Policy policy = PolicyBuilder().BuildOrDie();
  ExecutionRequest request = MakeRequest();
  request.env = {{"B", "2"}, {"A", "1"}};
  ContainerInvocation invocation = MakeInvocation(ContainerRuntime::kPodman);
  invocation.work_dir = "/workspace/src";

  std::vector<std::string> args =
      BuildContainerArgs(policy, request, invocation);
  EXPECT_THAT(args, Contains("--workdir=/workspace/src"));
  // Sorted by key, each preceded by -e.
  auto it = std::find(args.begin(), args.end(), "A=1");
  ASSERT_THAT(it != args.end(), IsTrue());
  EXPECT_THAT(*(it - 1), StrEq("-e"));
  EXPECT_THAT(*(it + 1), StrEq("-e"));
  EXPECT_THAT(*(it + 2), StrEq("B=2"));
}

TEST(ContainerTest, CommandComesLast) {
  const Policy policy =
      PolicyBuilder().SetMemory("1Gi").SetCpu(2).BuildOrDie();
  ExecutionRequest request;
  request.command = "python3";
  request.args = {"-c", "print(1)"};
  std::vector<std::string> args =
      BuildContainerArgs(policy, request,
                         MakeInvocation(ContainerRuntime::kDocker));
  ASSERT_THAT(args.size(), Gt(4u));
  EXPECT_THAT(args, Contains("--memory=1073741824"));
  EXPECT_THAT(args, Contains("--cpus=2"));
  EXPECT_THAT(std::vector<std::string>(args.end() - 4, args.end()),
              ElementsAre("alpine:latest", "python3", "-c", "print(1)"));
}

TEST(ContainerTest, SelectsContainersOlderThanMaxAge) {
  const absl::Time now = absl::FromUnixSeconds(1700003600);
  // docker prints "/name", podman prints "name".
  const std::string inspected =
      "/procjail-docker-aaaaaaaaaaaa-0 1700000000\n"
      "procjail-podman-bbbbbbbbbbbb-3 1700003000\n"
      "procjail-podman-cccccccccccc-1 1699990000\n"
      "unlabelled-container <no value>\n"
      "\n";
  EXPECT_THAT(SelectStaleContainers(inspected, now, absl::Minutes(30)),
              ElementsAre("procjail-docker-aaaaaaaaaaaa-0",
                          "procjail-podman-cccccccccccc-1"));
  EXPECT_THAT(SelectStaleContainers(inspected, now, absl::Hours(24)),
              IsEmpty());
  EXPECT_THAT(SelectStaleContainers("", now, absl::ZeroDuration()),
              IsEmpty());
}

TEST(ContainerTest, ReapWithoutRuntimeFails) {
  absl::FlagSaver flag_saver;
  absl::SetFlag(&FLAGS_procjail_runtime_search_path, "/nonexistent");
  EXPECT_THAT(ReapStaleContainers(ContainerRuntime::kDocker, absl::Hours(1)),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(ContainerTest, CallsGetPrivateWorkspaces) {
  if (!ContainerSandbox::IsAvailable(ContainerRuntime::kPodman)) {
    GTEST_SKIP() << "podman is not installed";
  }
  ContainerSandbox sandbox(ContainerRuntime::kPodman,
                           PolicyBuilder().BuildOrDie());
  ExecutionRequest request;
  request.command = "/bin/sh";
  request.args = {"-c", "test ! -e marker && touch marker && ls"};
  ExecutionResult first = sandbox.Execute(request);
  ExecutionResult second = sandbox.Execute(request);
  EXPECT_THAT(first.success, IsTrue()) << first.ToString();
  EXPECT_THAT(second.success, IsTrue()) << second.ToString();
  EXPECT_THAT(sandbox.Cleanup(), IsOk());
}

TEST(ContainerTest, InitializeAndCleanupWithInstalledRuntime) {
  if (!ContainerSandbox::IsAvailable(ContainerRuntime::kPodman)) {
    GTEST_SKIP() << "podman is not installed";
  }
  ContainerSandbox sandbox(ContainerRuntime::kPodman,
                           PolicyBuilder().BuildOrDie());
  ASSERT_THAT(sandbox.Initialize(), IsOk());
  const std::string scratch = sandbox.scratch_dir();
  EXPECT_THAT(fileops::IsDirectory(scratch), IsTrue());
  EXPECT_THAT(sandbox.Cleanup(), IsOk());
  EXPECT_THAT(fileops::Exists(scratch, false), IsFalse());
  EXPECT_THAT(sandbox.scratch_dir(), IsEmpty());
}

}  // namespace
}  // namespace procjail
