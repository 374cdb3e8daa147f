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

// Runs a single command in a procjail sandbox.
//
// Example usage:
//   procjail_tool
//     --procjail_tool_runtime=bubblewrap
//     --procjail_tool_memory=512Mi
//     --procjail_tool_network=none
//     --procjail_tool_allowed_paths=/srv/data
//     -- python3 /srv/data/job.py
//
// The tool prints the command's stdout and stderr and exits with its exit
// code, 128 + N if signal N terminated it, 124 if it timed out and 125 if it
// could not be run.
//
// Containers left behind by crashed callers are removed with
//   procjail_tool --procjail_tool_reap_containers=1h

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/policybuilder.h"
#include "procjail/registry.h"
#include "procjail/sandbox.h"
#include "procjail/util/fileops.h"

ABSL_FLAG(std::string, procjail_tool_runtime, "auto",
          "Sandbox runtime (gvisor, nsjail, bubblewrap, firejail, docker, "
          "podman, macos) or 'auto' for the strongest available one");
ABSL_FLAG(bool, procjail_tool_fallback, true,
          "Fall back to another runtime if the requested one is unavailable");
ABSL_FLAG(bool, procjail_tool_list_runtimes, false,
          "List the runtimes and their availability, then exit");
ABSL_FLAG(std::string, procjail_tool_memory, "256Mi",
          "Memory ceiling, e.g. 512Mi or 1Gi");
ABSL_FLAG(double, procjail_tool_cpu, 0.5, "CPU ceiling in cores");
ABSL_FLAG(procjail::NetworkMode, procjail_tool_network,
          procjail::NetworkMode::kNone,
          "Network access: none, restricted or host");
ABSL_FLAG(std::vector<std::string>, procjail_tool_allowed_hosts, {},
          "Comma separated hosts reachable with restricted networking");
ABSL_FLAG(bool, procjail_tool_read_only, true,
          "Make the filesystem visible to the command read-only");
ABSL_FLAG(std::vector<std::string>, procjail_tool_allowed_paths, {},
          "Comma separated host paths made visible to the command");
ABSL_FLAG(absl::Duration, procjail_tool_timeout, absl::Seconds(30),
          "Wall-clock limit of the command");
ABSL_FLAG(uint64_t, procjail_tool_max_output, 1 << 20,
          "Maximum number of bytes captured from stdout and from stderr");
ABSL_FLAG(std::string, procjail_tool_workdir, "",
          "Working directory of the command");
ABSL_FLAG(std::vector<std::string>, procjail_tool_env, {},
          "Comma separated KEY=VALUE pairs added to the environment");
ABSL_FLAG(bool, procjail_tool_stdin, false,
          "Pass this tool's stdin to the command");
ABSL_FLAG(std::string, procjail_tool_actor, "",
          "Who runs the command, recorded in the audit log");
ABSL_FLAG(absl::Duration, procjail_tool_reap_containers, absl::ZeroDuration(),
          "If positive, remove procjail containers older than this from all "
          "container runtimes and exit");

namespace {

constexpr int kExitTimeout = 124;
constexpr int kExitSandboxFailure = 125;

void ListRuntimes() {
  for (const procjail::RuntimeInfo& info : procjail::DetectRuntimes()) {
    absl::PrintF("%-12s %-13s %s\n", procjail::ToString(info.runtime),
                 info.available ? "available" : "unavailable", info.version);
  }
}

absl::StatusOr<procjail::Policy> PolicyFromFlags() {
  procjail::PolicyBuilder builder;
  builder.SetMemory(absl::GetFlag(FLAGS_procjail_tool_memory))
      .SetCpu(absl::GetFlag(FLAGS_procjail_tool_cpu))
      .SetNetwork(absl::GetFlag(FLAGS_procjail_tool_network))
      .SetReadOnly(absl::GetFlag(FLAGS_procjail_tool_read_only))
      .SetTimeout(absl::GetFlag(FLAGS_procjail_tool_timeout))
      .SetMaxOutputBytes(absl::GetFlag(FLAGS_procjail_tool_max_output));
  for (const std::string& path :
       absl::GetFlag(FLAGS_procjail_tool_allowed_paths)) {
    builder.AddAllowedPath(path);
  }
  for (const std::string& host :
       absl::GetFlag(FLAGS_procjail_tool_allowed_hosts)) {
    builder.AddAllowedHost(host);
  }
  if (const std::string work_dir = absl::GetFlag(FLAGS_procjail_tool_workdir);
      !work_dir.empty()) {
    builder.SetWorkDir(work_dir);
  }
  return builder.TryBuild();
}

absl::StatusOr<procjail::ExecutionRequest> RequestFromArgs(
    const std::vector<std::string>& args) {
  procjail::ExecutionRequest request;
  request.command = args[0];
  request.args.assign(args.begin() + 1, args.end());
  request.actor = absl::GetFlag(FLAGS_procjail_tool_actor);
  for (const std::string& entry : absl::GetFlag(FLAGS_procjail_tool_env)) {
    const size_t pos = entry.find('=');
    if (pos == std::string::npos || pos == 0) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid environment entry: '%s'", entry));
    }
    request.env[entry.substr(0, pos)] = entry.substr(pos + 1);
  }
  if (absl::GetFlag(FLAGS_procjail_tool_stdin)) {
    request.stdin_data.emplace(std::istreambuf_iterator<char>(std::cin),
                               std::istreambuf_iterator<char>());
  }
  return request;
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program_name =
      procjail::file_util::fileops::Basename(argv[0]);
  absl::SetProgramUsageMessage(
      absl::StrFormat("Runs a command in a sandbox.\n"
                      "Usage: %1$s [OPTION] -- CMD [ARGS]...",
                      program_name));

  std::vector<std::string> args;
  {
    const std::vector<char*> parsed_argv = absl::ParseCommandLine(argc, argv);
    args.assign(parsed_argv.begin() + 1, parsed_argv.end());
  }
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  absl::InitializeLog();

  if (absl::GetFlag(FLAGS_procjail_tool_list_runtimes)) {
    ListRuntimes();
    return EXIT_SUCCESS;
  }
  if (const absl::Duration max_age =
          absl::GetFlag(FLAGS_procjail_tool_reap_containers);
      max_age > absl::ZeroDuration()) {
    absl::StatusOr<int> removed = procjail::ReapStaleContainers(max_age);
    if (!removed.ok()) {
      LOG(ERROR) << "Reaping containers failed: " << removed.status();
      return EXIT_FAILURE;
    }
    absl::PrintF("Removed %d containers\n", *removed);
    return EXIT_SUCCESS;
  }
  if (args.empty()) {
    absl::FPrintF(stderr, "Missing command to execute\n");
    return EXIT_FAILURE;
  }

  std::optional<procjail::SandboxRuntime> runtime;
  if (const std::string name = absl::GetFlag(FLAGS_procjail_tool_runtime);
      name != "auto") {
    absl::StatusOr<procjail::SandboxRuntime> parsed =
        procjail::ParseSandboxRuntime(name);
    if (!parsed.ok()) {
      absl::FPrintF(stderr, "%s\n", parsed.status().message());
      return EXIT_FAILURE;
    }
    runtime = *parsed;
  }

  absl::StatusOr<procjail::Policy> policy = PolicyFromFlags();
  if (!policy.ok()) {
    absl::FPrintF(stderr, "Invalid policy: %s\n", policy.status().message());
    return EXIT_FAILURE;
  }
  absl::StatusOr<procjail::ExecutionRequest> request = RequestFromArgs(args);
  if (!request.ok()) {
    absl::FPrintF(stderr, "%s\n", request.status().message());
    return EXIT_FAILURE;
  }

  absl::StatusOr<procjail::SandboxRuntime> selected = procjail::SelectRuntime(
      runtime, absl::GetFlag(FLAGS_procjail_tool_fallback));
  if (!selected.ok()) {
    LOG(ERROR) << "Sandbox error: " << selected.status();
    return kExitSandboxFailure;
  }
  std::unique_ptr<procjail::Sandbox> sandbox =
      procjail::CreateSandbox(*selected, *std::move(policy));
  if (absl::Status status = sandbox->Initialize(); !status.ok()) {
    LOG(ERROR) << "Could not initialize the " << sandbox->name()
               << " sandbox: " << status;
    sandbox->Cleanup().IgnoreError();
    return kExitSandboxFailure;
  }
  VLOG(1) << "Running in " << sandbox->name() << " sandbox " << sandbox->id();

  const procjail::ExecutionResult result = sandbox->Execute(*request);
  sandbox->Cleanup().IgnoreError();

  std::fwrite(result.stdout_data.data(), 1, result.stdout_data.size(), stdout);
  std::fwrite(result.stderr_data.data(), 1, result.stderr_data.size(), stderr);
  std::fflush(stdout);

  if (result.timed_out) {
    LOG(ERROR) << "Sandbox error: " << result.ToString();
    return kExitTimeout;
  }
  if (result.term_signal != 0 && !result.error.has_value()) {
    // Shell convention for a process terminated by a signal.
    LOG(WARNING) << result.ToString();
    return 128 + result.term_signal;
  }
  if (result.error.has_value() ||
      result.exit_code == procjail::ExecutionResult::kNoExitCode) {
    LOG(ERROR) << "Sandbox error: " << result.ToString();
    return kExitSandboxFailure;
  }
  if (!result.success) {
    LOG(WARNING) << result.ToString();
  }
  return result.exit_code;
}
