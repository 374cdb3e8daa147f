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
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/flags.h"
#include "procjail/policy.h"
#include "procjail/probe.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

// Number of container names passed to a single `rm -f`.
constexpr size_t kRemoveBatchSize = 64;

std::string NetworkArg(ContainerRuntime runtime, NetworkMode mode) {
  switch (mode) {
    case NetworkMode::kNone:
      return "--network=none";
    case NetworkMode::kHost:
      return "--network=host";
    case NetworkMode::kRestricted:
      // A user-mode network stack is the closest approximation. Per-host
      // filtering is not available from the runtime.
      return runtime == ContainerRuntime::kPodman ? "--network=slirp4netns"
                                                  : "--network=bridge";
  }
  return "--network=none";
}

}  // namespace

absl::string_view ToolName(ContainerRuntime runtime) {
  switch (runtime) {
    case ContainerRuntime::kPodman:
      return "podman";
    case ContainerRuntime::kDocker:
      return "docker";
  }
  return "unknown";
}

std::vector<std::string> BuildContainerArgs(
    const Policy& policy, const ExecutionRequest& request,
    const ContainerInvocation& invocation) {
  std::vector<std::string> args = {
      invocation.tool_path,
      "run",
      "--rm",
      absl::StrCat("--name=", invocation.container_name),
      // Resource limits
      absl::StrCat("--memory=", policy.memory_bytes()),
      absl::StrCat("--cpus=", policy.cpu()),
      absl::StrCat("--pids-limit=", invocation.pids_limit),
      // Hardening, regardless of the policy
      "--security-opt=no-new-privileges",
      "--cap-drop=ALL",
      absl::StrCat("--label=", kContainerLabel),
      absl::StrCat("--label=", kCreatedLabel, "=",
                   absl::ToUnixSeconds(invocation.created)),
  };
  if (invocation.runtime == ContainerRuntime::kPodman) {
    args.push_back("--userns=keep-id");
  }
  args.push_back(NetworkArg(invocation.runtime, policy.network()));

  if (policy.read_only()) {
    args.push_back("--read-only");
    args.push_back(
        absl::StrCat("--tmpfs=/tmp:", ContainerSandbox::kTmpfsOptions));
  }

  args.push_back(absl::StrCat("--workdir=",
                              invocation.work_dir.empty()
                                  ? ContainerSandbox::kWorkspaceDir
                                  : absl::string_view(invocation.work_dir)));

  if (!invocation.workspace_dir.empty()) {
    args.push_back(absl::StrCat("--volume=", invocation.workspace_dir, ":",
                                ContainerSandbox::kWorkspaceDir, ":Z"));
  }
  for (const std::string& path : policy.allowed_paths()) {
    args.push_back(absl::StrCat("--volume=", path, ":", path, ":ro"));
  }
  for (const auto& [key, value] : request.env) {
    args.push_back("-e");
    args.push_back(absl::StrCat(key, "=", value));
  }
  // Keep stdin attached.
  args.push_back("-i");
  args.push_back(invocation.image);
  args.push_back(request.command);
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

std::vector<std::string> SelectStaleContainers(absl::string_view inspect_output,
                                               absl::Time now,
                                               absl::Duration max_age) {
  std::vector<std::string> stale;
  for (absl::string_view line :
       absl::StrSplit(inspect_output, '\n', absl::SkipWhitespace())) {
    std::vector<absl::string_view> fields =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    int64_t created = 0;
    if (fields.size() != 2 || !absl::SimpleAtoi(fields[1], &created)) {
      VLOG(1) << "Skipping container without creation time: " << line;
      continue;
    }
    // docker prefixes names with a slash.
    absl::string_view name = absl::StripPrefix(fields[0], "/");
    if (now - absl::FromUnixSeconds(created) > max_age) {
      stale.emplace_back(name);
    }
  }
  return stale;
}

absl::StatusOr<int> ReapStaleContainers(ContainerRuntime runtime,
                                        absl::Duration max_age) {
  PROCJAIL_ASSIGN_OR_RETURN(std::string tool, LocateTool(ToolName(runtime)));
  PROCJAIL_ASSIGN_OR_RETURN(
      std::string listing,
      RunTool(tool, {"ps", "-a", "--filter",
                     absl::StrCat("label=", kContainerLabel), "--format",
                     "{{.Names}}"}));
  std::vector<std::string> names =
      absl::StrSplit(listing, '\n', absl::SkipWhitespace());
  if (names.empty()) {
    return 0;
  }
  std::vector<std::string> inspect_args = {
      "inspect", "--format", std::string(kInspectCreatedFormat)};
  inspect_args.insert(inspect_args.end(), names.begin(), names.end());
  PROCJAIL_ASSIGN_OR_RETURN(std::string inspected,
                            RunTool(tool, inspect_args));
  std::vector<std::string> stale =
      SelectStaleContainers(inspected, absl::Now(), max_age);

  int removed = 0;
  for (size_t i = 0; i < stale.size(); i += kRemoveBatchSize) {
    const size_t end = std::min(stale.size(), i + kRemoveBatchSize);
    std::vector<std::string> rm_args = {"rm", "-f"};
    rm_args.insert(rm_args.end(), stale.begin() + i, stale.begin() + end);
    PROCJAIL_RETURN_IF_ERROR(RunTool(tool, rm_args).status());
    removed += static_cast<int>(end - i);
  }
  LOG(INFO) << "Removed " << removed << " stale " << ToolName(runtime)
            << " containers";
  return removed;
}

ContainerSandbox::ContainerSandbox(ContainerRuntime runtime, Policy policy)
    : Sandbox(std::move(policy)), runtime_(runtime) {
  if (this->policy().network() == NetworkMode::kRestricted) {
    LOG(WARNING) << ToolName(runtime_)
                 << ": restricted networking is approximated with "
                 << NetworkArg(runtime_, NetworkMode::kRestricted)
                 << ", allowed hosts are not enforced";
  }
}

ContainerSandbox::~ContainerSandbox() { Cleanup().IgnoreError(); }

bool ContainerSandbox::IsAvailable(ContainerRuntime runtime) {
  return Version(runtime).ok();
}

absl::StatusOr<std::string> ContainerSandbox::Version(
    ContainerRuntime runtime) {
  return ProbeToolVersion(ToolName(runtime));
}

absl::Status ContainerSandbox::CheckPrerequisites() {
  PROCJAIL_ASSIGN_OR_RETURN(tool_path_, LocateTool(ToolName(runtime_)));
  return absl::OkStatus();
}

absl::StatusOr<Command> ContainerSandbox::BuildCommand(
    const ExecutionRequest& request, const CallContext& call) {
  if (request.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  ContainerInvocation invocation;
  invocation.runtime = runtime_;
  invocation.tool_path = tool_path_;
  invocation.container_name = call.id;
  invocation.workspace_dir = call.scratch_dir;
  invocation.work_dir = ResolveWorkDir(request, kWorkspaceDir);
  invocation.image = absl::GetFlag(FLAGS_procjail_container_image);
  invocation.pids_limit = absl::GetFlag(FLAGS_procjail_pids_limit);
  invocation.created = absl::Now();

  Command command;
  command.argv = BuildContainerArgs(policy(), request, invocation);
  // The request environment reaches the container through -e only.
  command.envp = util::ToEnvStrings(util::MinimalEnvironment());
  command.stdin_data = request.stdin_data;
  return command;
}

void ContainerSandbox::OnTimeout(absl::string_view call_id) {
  StartHelper({tool_path_, "kill", std::string(call_id)});
}

absl::Status ContainerSandbox::TearDown() {
  std::vector<std::string> names = call_ids();
  absl::Status status;
  for (size_t i = 0; i < names.size(); i += kRemoveBatchSize) {
    std::vector<std::string> argv = {tool_path_, "rm", "-f"};
    if (runtime_ == ContainerRuntime::kPodman) {
      argv.push_back("--ignore");
    }
    const size_t end = std::min(names.size(), i + kRemoveBatchSize);
    argv.insert(argv.end(), names.begin() + i, names.begin() + end);
    ExecutionResult result = RunHelper(std::move(argv));
    if (result.error.has_value() || result.timed_out) {
      // The runtime itself could not be run.
      status.Update(absl::UnavailableError(absl::StrCat(
          ToolName(runtime_), " rm failed: ", result.ToString())));
    } else if (!result.success) {
      // Containers are started with --rm, most of them are already gone.
      VLOG(1) << ToolName(runtime_) << " rm: " << result.ToString() << ": "
              << result.stderr_data;
    }
  }
  return status;
}

}  // namespace procjail
