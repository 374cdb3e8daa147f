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

// User-space kernel backend built on gVisor's `runsc do`, which runs a host
// command inside a gVisor sandbox with a memory-backed overlay over the
// host's root filesystem.

#ifndef PROCJAIL_BACKENDS_GVISOR_H_
#define PROCJAIL_BACKENDS_GVISOR_H_

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

// Builds the runsc command line for one call.
std::vector<std::string> BuildRunscArgs(const Policy& policy,
                                        const ExecutionRequest& request,
                                        absl::string_view tool_path,
                                        absl::string_view work_dir);

class GVisorSandbox final : public Sandbox {
 public:
  explicit GVisorSandbox(Policy policy);

  absl::string_view name() const override { return "gvisor"; }

  static bool IsAvailable();
  static absl::StatusOr<std::string> Version();

 protected:
  absl::Status CheckPrerequisites() override;

  absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                       const CallContext& call) override;

 private:
  std::string tool_path_;
};

}  // namespace procjail

#endif  // PROCJAIL_BACKENDS_GVISOR_H_
