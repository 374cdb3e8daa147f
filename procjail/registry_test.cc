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

#include "procjail/registry.h"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/flags/flag.h"
#include "absl/flags/reflection.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/flags.h"
#include "procjail/policybuilder.h"
#include "procjail/sandbox.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::SizeIs;
using ::testing::StrEq;

std::vector<RuntimeInfo> Detected(
    std::initializer_list<SandboxRuntime> available) {
  std::vector<RuntimeInfo> detected;
  for (SandboxRuntime runtime : RuntimePreferenceOrder()) {
    RuntimeInfo info;
    info.runtime = runtime;
    for (SandboxRuntime a : available) {
      if (a == runtime) {
        info.available = true;
        info.version = "1.0";
      }
    }
    detected.push_back(info);
  }
  return detected;
}

TEST(RegistryTest, PreferenceOrder) {
  EXPECT_THAT(
      RuntimePreferenceOrder(),
      ElementsAre(SandboxRuntime::kGVisor, SandboxRuntime::kNsjail,
                  SandboxRuntime::kBubblewrap, SandboxRuntime::kFirejail,
                  SandboxRuntime::kDocker, SandboxRuntime::kPodman,
                  SandboxRuntime::kMacOs));
}

TEST(RegistryTest, NamesRoundTrip) {
  for (SandboxRuntime runtime : RuntimePreferenceOrder()) {
    EXPECT_THAT(ParseSandboxRuntime(ToString(runtime)), IsOkAndHolds(runtime));
  }
  EXPECT_THAT(ParseSandboxRuntime("BWRAP"),
              IsOkAndHolds(SandboxRuntime::kBubblewrap));
  EXPECT_THAT(ParseSandboxRuntime("chroot"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(RegistryTest, FlagParsing) {
  SandboxRuntime runtime = SandboxRuntime::kGVisor;
  std::string error;
  EXPECT_TRUE(AbslParseFlag("podman", &runtime, &error));
  EXPECT_THAT(runtime, Eq(SandboxRuntime::kPodman));
  EXPECT_FALSE(AbslParseFlag("vmware", &runtime, &error));
  EXPECT_THAT(error, HasSubstr("vmware"));
  EXPECT_THAT(AbslUnparseFlag(SandboxRuntime::kMacOs), StrEq("macos"));
}

TEST(RegistryTest, AutoPicksMostPreferred) {
  EXPECT_THAT(
      SelectRuntime(std::nullopt, /*fallback_enabled=*/false,
                    Detected({SandboxRuntime::kPodman,
                              SandboxRuntime::kBubblewrap})),
      IsOkAndHolds(SandboxRuntime::kBubblewrap));
}

TEST(RegistryTest, RequestedRuntimeWins) {
  EXPECT_THAT(
      SelectRuntime(SandboxRuntime::kPodman, /*fallback_enabled=*/false,
                    Detected({SandboxRuntime::kPodman,
                              SandboxRuntime::kBubblewrap})),
      IsOkAndHolds(SandboxRuntime::kPodman));
}

TEST(RegistryTest, Fallback) {
  const std::vector<RuntimeInfo> detected =
      Detected({SandboxRuntime::kFirejail, SandboxRuntime::kDocker});
  EXPECT_THAT(SelectRuntime(SandboxRuntime::kGVisor, /*fallback_enabled=*/true,
                            detected),
              IsOkAndHolds(SandboxRuntime::kFirejail));
  EXPECT_THAT(SelectRuntime(SandboxRuntime::kGVisor,
                            /*fallback_enabled=*/false, detected),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(RegistryTest, NothingAvailable) {
  EXPECT_THAT(SelectRuntime(std::nullopt, /*fallback_enabled=*/true,
                            Detected({})),
              StatusIs(absl::StatusCode::kNotFound,
                       HasSubstr("No sandbox runtime available")));
}

TEST(RegistryTest, CreateSandbox) {
  for (SandboxRuntime runtime : RuntimePreferenceOrder()) {
    std::unique_ptr<Sandbox> sandbox =
        CreateSandbox(runtime, PolicyBuilder().BuildOrDie());
    ASSERT_THAT(sandbox, Not(Eq(nullptr)));
    EXPECT_THAT(sandbox->name(), StrEq(ToString(runtime)));
    EXPECT_THAT(sandbox->is_initialized(), Eq(false));
    EXPECT_THAT(sandbox->id(), IsEmpty());
  }
}

TEST(RegistryTest, DetectRuntimesCoversEveryRuntime) {
  std::vector<RuntimeInfo> runtimes = DetectRuntimes();
  ASSERT_THAT(runtimes, SizeIs(RuntimePreferenceOrder().size()));
  for (const RuntimeInfo& info : runtimes) {
    if (!info.available) {
      EXPECT_THAT(info.version, IsEmpty()) << ToString(info.runtime);
    } else {
      EXPECT_THAT(info.version, Not(IsEmpty())) << ToString(info.runtime);
    }
  }
}

TEST(RegistryTest, ExecuteInSandboxWithoutRuntime) {
  if (SelectRuntime(std::nullopt).ok()) {
    GTEST_SKIP() << "A sandbox runtime is installed";
  }
  ExecutionRequest request;
  request.command = "true";
  EXPECT_THAT(ExecuteInSandbox(request, PolicyBuilder().BuildOrDie()),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(RegistryTest, ReapWithoutContainerRuntimesRemovesNothing) {
  absl::FlagSaver flag_saver;
  absl::SetFlag(&FLAGS_procjail_runtime_search_path, "/nonexistent");
  EXPECT_THAT(ReapStaleContainers(absl::Hours(1)), IsOkAndHolds(Eq(0)));
}

}  // namespace
}  // namespace procjail
