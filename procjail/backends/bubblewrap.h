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

// Namespace based backend built on bubblewrap (bwrap). The command sees a
// minimal read-only view of the host's binaries and libraries, a writable
// /tmp and home backed by the call's scratch directory, and nothing else.

#ifndef PROCJAIL_BACKENDS_BUBBLEWRAP_H_
#define PROCJAIL_BACKENDS_BUBBLEWRAP_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/sandbox.h"
#include "procjail/subprocess.h"

namespace procjail {

// Builds the bwrap command line for one call. `call_dir` is the call's
// scratch directory, prepared by BubblewrapSandbox (tmp/ and home/ inside).
std::vector<std::string> BuildBubblewrapArgs(const Policy& policy,
                                             const ExecutionRequest& request,
                                             absl::string_view tool_path,
                                             absl::string_view call_dir,
                                             absl::string_view work_dir);

class BubblewrapSandbox final : public Sandbox {
 public:
  static constexpr absl::string_view kHomeDir = "/home/sandbox";
  static constexpr int kSandboxUid = 1000;
  static constexpr int kSandboxGid = 1000;

  explicit BubblewrapSandbox(Policy policy) : Sandbox(std::move(policy)) {}

  absl::string_view name() const override { return "bubblewrap"; }

  static bool IsAvailable();
  static absl::StatusOr<std::string> Version();

 protected:
  absl::Status CheckPrerequisites() override;

  // Also creates the directories backing /tmp and the home directory.
  absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                       const CallContext& call) override;

 private:
  std::string tool_path_;
};

}  // namespace procjail

#endif  // PROCJAIL_BACKENDS_BUBBLEWRAP_H_
