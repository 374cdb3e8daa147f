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
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "procjail/config.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/probe.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

constexpr absl::string_view kTool = "runsc";

absl::string_view NetworkArg(NetworkMode mode) {
  switch (mode) {
    case NetworkMode::kNone:
      return "--network=none";
    case NetworkMode::kRestricted:
      // gVisor's own network stack, no per-host filtering.
      return "--network=sandbox";
    case NetworkMode::kHost:
      return "--network=host";
  }
  return "--network=none";
}

}  // namespace

std::vector<std::string> BuildRunscArgs(const Policy& policy,
                                        const ExecutionRequest& request,
                                        absl::string_view tool_path,
                                        absl::string_view work_dir) {
  std::vector<std::string> args = {
      std::string(tool_path), "--rootless",
      std::string(NetworkArg(policy.network())),
      // Rootless runs cannot manage cgroups.
      "--ignore-cgroups", "do",
  };
  if (!work_dir.empty()) {
    args.push_back(absl::StrCat("--cwd=", work_dir));
  }
  args.push_back("--");
  args.push_back(request.command);
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

GVisorSandbox::GVisorSandbox(Policy policy) : Sandbox(std::move(policy)) {
  LOG_FIRST_N(WARNING, 1)
      << "gvisor: memory and cpu ceilings are not applied by `runsc do`, "
         "only the wall-clock timeout and output limits are";
  if (this->policy().network() == NetworkMode::kRestricted) {
    LOG(WARNING) << "gvisor: restricted networking uses the sandbox network "
                    "stack, allowed hosts are not enforced";
  }
}

bool GVisorSandbox::IsAvailable() { return Version().ok(); }

absl::StatusOr<std::string> GVisorSandbox::Version() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError("gVisor requires Linux");
  }
  return ProbeToolVersion(kTool);
}

absl::Status GVisorSandbox::CheckPrerequisites() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError(
        absl::StrCat("gVisor requires Linux, running on ", host_os::Name()));
  }
  PROCJAIL_ASSIGN_OR_RETURN(tool_path_, LocateTool(kTool));
  return absl::OkStatus();
}

absl::StatusOr<Command> GVisorSandbox::BuildCommand(
    const ExecutionRequest& request, const CallContext& call) {
  if (request.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  Command command;
  command.argv = BuildRunscArgs(policy(), request, tool_path_,
                                ResolveWorkDir(request, call.scratch_dir));
  command.envp = util::ToEnvStrings(ToolEnvironment(request));
  command.stdin_data = request.stdin_data;
  return command;
}

}  // namespace procjail
