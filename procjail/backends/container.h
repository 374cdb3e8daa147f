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

// Rootless container backend (podman) and its docker sibling. Every call runs
// a fresh, named, auto-removed container from a small base image.

#ifndef PROCJAIL_BACKENDS_CONTAINER_H_
#define PROCJAIL_BACKENDS_CONTAINER_H_

#include <string>
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

enum class ContainerRuntime {
  kPodman,
  kDocker,
};

// Returns the name of the runtime's command line tool.
absl::string_view ToolName(ContainerRuntime runtime);

// Every container started by procjail carries kContainerLabel, and
// kCreatedLabel set to its creation time in seconds since the Unix epoch.
inline constexpr absl::string_view kContainerLabel = "procjail";
inline constexpr absl::string_view kCreatedLabel = "procjail.created";

// Everything a container command line depends on besides the policy and the
// request.
struct ContainerInvocation {
  ContainerRuntime runtime = ContainerRuntime::kPodman;
  // Path (or name) of the runtime tool, becomes argv[0].
  std::string tool_path;
  std::string container_name;
  // Host directory mounted at kWorkspaceDir.
  std::string workspace_dir;
  // Working directory inside the container, kWorkspaceDir when empty.
  std::string work_dir;
  std::string image;
  int pids_limit = 128;
  absl::Time created = absl::UnixEpoch();
};

// Builds the `<runtime> run` command line for one call.
std::vector<std::string> BuildContainerArgs(
    const Policy& policy, const ExecutionRequest& request,
    const ContainerInvocation& invocation);

// Go template for `<runtime> inspect` that prints "<name> <created label>"
// per container.
inline constexpr absl::string_view kInspectCreatedFormat =
    "{{.Name}} {{index .Config.Labels \"procjail.created\"}}";

// Picks the containers created before `now - max_age` from `inspect_output`
// (one "<name> <seconds>" line per container, see kInspectCreatedFormat).
// Lines without a valid creation time are skipped.
std::vector<std::string> SelectStaleContainers(absl::string_view inspect_output,
                                               absl::Time now,
                                               absl::Duration max_age);

// Force-removes the procjail containers of `runtime` older than `max_age`,
// including those left behind by processes that died before Cleanup().
// Returns the number of containers removed.
absl::StatusOr<int> ReapStaleContainers(ContainerRuntime runtime,
                                        absl::Duration max_age);

class ContainerSandbox final : public Sandbox {
 public:
  static constexpr absl::string_view kWorkspaceDir = "/workspace";
  static constexpr absl::string_view kTmpfsOptions =
      "rw,noexec,nosuid,size=64m";

  ContainerSandbox(ContainerRuntime runtime, Policy policy);

  // Removes all containers still registered with this instance.
  ~ContainerSandbox() override;

  absl::string_view name() const override { return ToolName(runtime_); }

  ContainerRuntime runtime() const { return runtime_; }

  // Returns whether the runtime's tool is installed and answers --version.
  static bool IsAvailable(ContainerRuntime runtime);
  static absl::StatusOr<std::string> Version(ContainerRuntime runtime);

 protected:
  absl::Status CheckPrerequisites() override;

  absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                       const CallContext& call) override;

  // Stops the named container alongside the signal sent to the client.
  void OnTimeout(absl::string_view call_id) override;

  // Force-removes every container minted by this instance.
  absl::Status TearDown() override;

 private:
  const ContainerRuntime runtime_;
  std::string tool_path_;
};

}  // namespace procjail

#endif  // PROCJAIL_BACKENDS_CONTAINER_H_
