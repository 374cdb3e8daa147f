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

// Namespace and seccomp backend built on nsjail. The policy is compiled into
// an nsjail configuration (protobuf text format) once per instance.

#ifndef PROCJAIL_BACKENDS_NSJAIL_H_
#define PROCJAIL_BACKENDS_NSJAIL_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "procjail/backends/nsjail_config.pb.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/sandbox.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"

namespace procjail {

// Returns the nsjail configuration enforcing `policy`.
nsjail::NsJailConfig BuildNsjailConfig(const Policy& policy);

// Renders `config` in protobuf text format.
absl::StatusOr<std::string> RenderNsjailConfig(
    const nsjail::NsJailConfig& config);

// Builds the nsjail command line for one call. nsjail executes `executable`
// without a PATH lookup, so it must be a path valid inside the jail.
std::vector<std::string> BuildNsjailArgs(const ExecutionRequest& request,
                                         const EnvMap& env,
                                         absl::string_view tool_path,
                                         absl::string_view config_path,
                                         absl::string_view work_dir,
                                         absl::string_view executable);

class NsjailSandbox final : public Sandbox {
 public:
  static constexpr absl::string_view kConfigName = "nsjail.cfg";

  explicit NsjailSandbox(Policy policy);

  absl::string_view name() const override { return "nsjail"; }

  static bool IsAvailable();
  static absl::StatusOr<std::string> Version();

 protected:
  absl::Status CheckPrerequisites() override;

  // Writes the configuration into the profile directory.
  absl::Status SetUp(absl::string_view scratch_dir) override;

  absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                       const CallContext& call) override;

 private:
  std::string tool_path_;
};

}  // namespace procjail

#endif  // PROCJAIL_BACKENDS_NSJAIL_H_
