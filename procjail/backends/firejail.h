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

// Profile based backend built on firejail. The isolation policy is compiled
// into a firejail profile once per instance; every call then runs
// `firejail --profile=...` with the command.

#ifndef PROCJAIL_BACKENDS_FIREJAIL_H_
#define PROCJAIL_BACKENDS_FIREJAIL_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/sandbox.h"
#include "procjail/subprocess.h"

namespace procjail {

// Renders the firejail profile enforcing `policy`.
std::string GenerateFirejailProfile(const Policy& policy);

// Formats a duration as firejail's --timeout argument (hh:mm:ss), rounding
// up to whole seconds.
std::string FormatFirejailTimeout(absl::Duration timeout);

// Builds the firejail command line for one call. `profile_dir` holds the
// profile and is made read-only inside the jail. `work_dir` may be empty.
std::vector<std::string> BuildFirejailArgs(const Policy& policy,
                                           const ExecutionRequest& request,
                                           absl::string_view tool_path,
                                           absl::string_view profile_dir,
                                           absl::string_view jail_name,
                                           absl::string_view work_dir);

class FirejailSandbox final : public Sandbox {
 public:
  static constexpr absl::string_view kProfileName = "sandbox.profile";

  explicit FirejailSandbox(Policy policy);

  absl::string_view name() const override { return "firejail"; }

  static bool IsAvailable();
  static absl::StatusOr<std::string> Version();

 protected:
  absl::Status CheckPrerequisites() override;

  // Writes the profile into the profile directory.
  absl::Status SetUp(absl::string_view scratch_dir) override;

  // Home and /tmp are private to each jail, the call's scratch directory is
  // not used.
  absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                       const CallContext& call) override;

  // Asks firejail to shut the named jail down.
  void OnTimeout(absl::string_view call_id) override;

 private:
  std::string tool_path_;
};

}  // namespace procjail

#endif  // PROCJAIL_BACKENDS_FIREJAIL_H_
