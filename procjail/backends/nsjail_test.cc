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

#include "procjail/backends/nsjail.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/backends/nsjail_config.pb.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/policybuilder.h"
#include "procjail/testing.h"
#include "procjail/util.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

using ::testing::ElementsAre;
using ::testing::EndsWith;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Not;
using ::testing::StrEq;

const nsjail::MountPt* FindMount(const nsjail::NsJailConfig& config,
                                 absl::string_view dst) {
  for (const nsjail::MountPt& mount : config.mount()) {
    if (mount.dst() == dst) {
      return &mount;
    }
  }
  return nullptr;
}

TEST(NsjailConfigTest, Defaults) {
  const nsjail::NsJailConfig config =
      BuildNsjailConfig(PolicyBuilder().BuildOrDie());
  EXPECT_THAT(config.mode(), Eq(nsjail::ONCE));
  EXPECT_THAT(config.hostname(), StrEq("sandbox"));
  EXPECT_THAT(config.time_limit(), Eq(30u));
  EXPECT_THAT(config.rlimit_as(), Eq(256u));
  EXPECT_THAT(config.rlimit_cpu(), Eq(30u));
  EXPECT_THAT(config.rlimit_fsize(), Eq(1u));
  EXPECT_THAT(config.rlimit_nofile(), Eq(32u));
  // Network none keeps the command in its own network namespace.
  EXPECT_THAT(config.clone_newnet(), IsTrue());
  EXPECT_THAT(config.clone_newuser(), IsTrue());
  EXPECT_THAT(config.clone_newpid(), IsTrue());
}

TEST(NsjailConfigTest, LimitsRoundUp) {
  const nsjail::NsJailConfig config =
      BuildNsjailConfig(PolicyBuilder()
                            .SetMemory("1536Ki")
                            .SetCpu(0.01)
                            .SetTimeout(absl::Milliseconds(1500))
                            .SetMaxOutputBytes(3 * Policy::kMiB + 1)
                            .BuildOrDie());
  EXPECT_THAT(config.rlimit_as(), Eq(2u));
  EXPECT_THAT(config.rlimit_cpu(), Eq(1u));
  EXPECT_THAT(config.time_limit(), Eq(2u));
  EXPECT_THAT(config.rlimit_fsize(), Eq(4u));
}

TEST(NsjailConfigTest, NetworkSharedUnlessNone) {
  EXPECT_THAT(BuildNsjailConfig(
                  PolicyBuilder().SetNetwork(NetworkMode::kHost).BuildOrDie())
                  .clone_newnet(),
              IsFalse());
}

TEST(NsjailConfigTest, Mounts) {
  const nsjail::NsJailConfig config = BuildNsjailConfig(
      PolicyBuilder().AddAllowedPath("/srv/data").BuildOrDie());
  const nsjail::MountPt* usr = FindMount(config, "/usr");
  ASSERT_THAT(usr, Not(Eq(nullptr)));
  EXPECT_THAT(usr->is_bind(), IsTrue());
  EXPECT_THAT(usr->rw(), IsFalse());

  const nsjail::MountPt* lib64 = FindMount(config, "/lib64");
  ASSERT_THAT(lib64, Not(Eq(nullptr)));
  EXPECT_THAT(lib64->mandatory(), IsFalse());

  const nsjail::MountPt* tmp = FindMount(config, "/tmp");
  ASSERT_THAT(tmp, Not(Eq(nullptr)));
  EXPECT_THAT(tmp->fstype(), StrEq("tmpfs"));
  EXPECT_THAT(tmp->rw(), IsFalse());

  const nsjail::MountPt* data = FindMount(config, "/srv/data");
  ASSERT_THAT(data, Not(Eq(nullptr)));
  EXPECT_THAT(data->rw(), IsFalse());

  const nsjail::NsJailConfig writable = BuildNsjailConfig(
      PolicyBuilder().SetReadOnly(false).AddAllowedPath("/srv/data")
          .BuildOrDie());
  EXPECT_THAT(FindMount(writable, "/tmp")->rw(), IsTrue());
  EXPECT_THAT(FindMount(writable, "/srv/data")->rw(), IsTrue());
}

TEST(NsjailConfigTest, SeccompAllowList) {
  const nsjail::NsJailConfig config =
      BuildNsjailConfig(PolicyBuilder().BuildOrDie());
  ASSERT_THAT(config.seccomp_string_size(), Eq(22));
  EXPECT_THAT(config.seccomp_string(0), StrEq("ALLOW {"));
  EXPECT_THAT(config.seccomp_string(1), HasSubstr("read, write"));
  EXPECT_THAT(config.seccomp_string(1), EndsWith(","));
  EXPECT_THAT(config.seccomp_string(19), Not(EndsWith(",")));
  EXPECT_THAT(config.seccomp_string(20), StrEq("}"));
  EXPECT_THAT(config.seccomp_string(21), StrEq("DEFAULT KILL"));
}

TEST(NsjailConfigTest, RendersTextFormat) {
  PROCJAIL_ASSERT_OK_AND_ASSIGN(
      std::string text,
      RenderNsjailConfig(BuildNsjailConfig(PolicyBuilder().BuildOrDie())));
  EXPECT_THAT(text, HasSubstr("mode: ONCE\n"));
  EXPECT_THAT(text, HasSubstr("hostname: \"sandbox\"\n"));
  EXPECT_THAT(text, HasSubstr("clone_newnet: true\n"));
  EXPECT_THAT(text, HasSubstr("seccomp_string: \"DEFAULT KILL\"\n"));
}

TEST(NsjailTest, Args) {
  ExecutionRequest request;
  request.command = "ls";
  request.args = {"-la"};
  EnvMap env = {{"PATH", "/usr/bin:/bin"}, {"HOME", "/tmp"}};
  EXPECT_THAT(
      BuildNsjailArgs(request, env, "/usr/bin/nsjail", "/s/nsjail.cfg",
                      "/tmp", "/usr/bin/ls"),
      ElementsAre("/usr/bin/nsjail", "--config", "/s/nsjail.cfg", "--quiet",
                  "--env", "HOME=/tmp", "--env", "PATH=/usr/bin:/bin",
                  "--cwd", "/tmp", "--", "/usr/bin/ls", "-la"));
}

TEST(NsjailTest, RunsCommand) {
  SKIP_UNLESS_LINUX;
  if (!NsjailSandbox::IsAvailable()) {
    GTEST_SKIP() << "nsjail is not installed";
  }
  NsjailSandbox sandbox(PolicyBuilder().BuildOrDie());
  ExecutionRequest request;
  request.command = "echo";
  request.args = {"hello"};
  ExecutionResult result = sandbox.Execute(request);
  sandbox.Cleanup().IgnoreError();
  if (!result.success && result.exit_code == 255) {
    GTEST_SKIP() << "nsjail cannot create namespaces here: "
                 << result.stderr_data;
  }
  EXPECT_THAT(result.success, IsTrue()) << result.ToString();
  EXPECT_THAT(result.stdout_data, StrEq("hello\n"));
}

}  // namespace
}  // namespace procjail
