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

// macOS backend built on sandbox-exec and a generated Seatbelt (SBPL)
// profile: deny by default, then allow what a command needs to start, the
// call scratch directories and the policy's extra paths. The profile itself
// lives outside everything the profile grants write access to.

#ifndef PROCJAIL_BACKENDS_MACOS_H_
#define PROCJAIL_BACKENDS_MACOS_H_

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

// Renders the Seatbelt profile enforcing `policy`. `writable_dir` is granted
// read and write access and should be a canonical path: Seatbelt matches
// resolved paths (e.g. /private/var/... rather than /var/...).
std::string GenerateSeatbeltProfile(const Policy& policy,
                                    absl::string_view writable_dir);

// Builds the sandbox-exec command line for one call.
std::vector<std::string> BuildSeatbeltArgs(const ExecutionRequest& request,
                                           absl::string_view tool_path,
                                           absl::string_view profile_path);

class MacOsSandbox final : public Sandbox {
 public:
  static constexpr absl::string_view kProfileName = "sandbox.sb";

  explicit MacOsSandbox(Policy policy) : Sandbox(std::move(policy)) {}

  absl::string_view name() const override { return "macos"; }

  static bool IsAvailable();
  // sandbox-exec has no version option, it ships with the OS.
  static absl::StatusOr<std::string> Version();

 protected:
  absl::Status CheckPrerequisites() override;

  // Writes the profile into the profile directory. Only the work root of the
  // scratch directory is writable under it.
  absl::Status SetUp(absl::string_view scratch_dir) override;

  absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                       const CallContext& call) override;

 private:
  std::string tool_path_;
};

}  // namespace procjail

#endif  // PROCJAIL_BACKENDS_MACOS_H_
