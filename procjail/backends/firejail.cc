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

#include "procjail/backends/firejail.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/config.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/probe.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"
#include "procjail/util/file_helpers.h"
#include "procjail/util/path.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

constexpr absl::string_view kTool = "firejail";

constexpr absl::string_view kProfileHeader = R"(# procjail firejail profile

# Sensitive host locations
blacklist /boot
blacklist /media
blacklist /mnt
blacklist /opt
blacklist /root
blacklist /srv
blacklist /sys/firmware

# Private home and /tmp
private
private-tmp

no-new-privs
seccomp
caps.drop all

nosound
novideo
dbus-user none
dbus-system none
)";

// Fixed ceilings, not configurable through the policy.
constexpr int kMaxProcesses = 64;
constexpr int kMaxOpenFiles = 128;

}  // namespace

std::string GenerateFirejailProfile(const Policy& policy) {
  std::string profile(kProfileHeader);

  absl::StrAppend(&profile, "\n# Resource limits\n");
  // rlimit-as takes bytes.
  absl::StrAppend(&profile, "rlimit-as ", policy.memory_bytes(), "\n");
  // One core for a minute per unit of cpu.
  absl::StrAppend(&profile, "rlimit-cpu ",
                  static_cast<int64_t>(std::ceil(policy.cpu() * 60)), "\n");
  absl::StrAppend(&profile, "rlimit-fsize ", policy.max_output_bytes(), "\n");
  absl::StrAppend(&profile, "rlimit-nproc ", kMaxProcesses, "\n");
  absl::StrAppend(&profile, "rlimit-nofile ", kMaxOpenFiles, "\n");

  switch (policy.network()) {
    case NetworkMode::kNone:
      absl::StrAppend(&profile, "\nnet none\n");
      break;
    case NetworkMode::kRestricted:
      // firejail's default client filter; per-host rules would need a
      // dedicated filter file.
      absl::StrAppend(&profile, "\nnetfilter\n");
      break;
    case NetworkMode::kHost:
      break;
  }

  if (policy.read_only()) {
    absl::StrAppend(&profile, "\nread-only ${HOME}\nread-only /tmp\n");
  }

  if (!policy.allowed_paths().empty()) {
    absl::StrAppend(&profile, "\n");
  }
  for (const std::string& path : policy.allowed_paths()) {
    absl::StrAppend(&profile, "whitelist ", path, "\n");
    if (policy.read_only()) {
      absl::StrAppend(&profile, "read-only ", path, "\n");
    }
  }
  return profile;
}

std::string FormatFirejailTimeout(absl::Duration timeout) {
  int64_t seconds = absl::ToInt64Seconds(absl::Ceil(timeout, absl::Seconds(1)));
  if (seconds < 1) {
    seconds = 1;
  }
  return absl::StrFormat("%02d:%02d:%02d", seconds / 3600, seconds / 60 % 60,
                         seconds % 60);
}

std::vector<std::string> BuildFirejailArgs(const Policy& policy,
                                           const ExecutionRequest& request,
                                           absl::string_view tool_path,
                                           absl::string_view profile_dir,
                                           absl::string_view jail_name,
                                           absl::string_view work_dir) {
  std::vector<std::string> args = {
      std::string(tool_path),
      absl::StrCat("--profile=",
                   file::JoinPath(profile_dir,
                                  FirejailSandbox::kProfileName)),
      // The profile is read before the jail starts and must stay intact for
      // later calls.
      absl::StrCat("--read-only=", profile_dir),
      "--quiet",
      absl::StrCat("--name=", jail_name),
      "--deterministic-exit-code",
      // firejail's own watchdog, independent of ours.
      absl::StrCat("--timeout=", FormatFirejailTimeout(policy.timeout())),
  };
  if (!work_dir.empty()) {
    args.push_back(absl::StrCat("--private-cwd=", work_dir));
  }
  for (const auto& [key, value] : request.env) {
    args.push_back(absl::StrCat("--env=", key, "=", value));
  }
  args.push_back("--");
  args.push_back(request.command);
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

FirejailSandbox::FirejailSandbox(Policy policy) : Sandbox(std::move(policy)) {
  if (this->policy().network() == NetworkMode::kRestricted) {
    LOG(WARNING) << "firejail: restricted networking uses the default "
                    "netfilter, allowed hosts are not enforced";
  }
}

bool FirejailSandbox::IsAvailable() { return Version().ok(); }

absl::StatusOr<std::string> FirejailSandbox::Version() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError("firejail requires Linux");
  }
  return ProbeToolVersion(kTool);
}

absl::Status FirejailSandbox::CheckPrerequisites() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError(
        absl::StrCat("firejail requires Linux, running on ", host_os::Name()));
  }
  PROCJAIL_ASSIGN_OR_RETURN(tool_path_, LocateTool(kTool));
  return absl::OkStatus();
}

absl::Status FirejailSandbox::SetUp(absl::string_view scratch_dir) {
  return file::SetContents(
      file::JoinPath(ProfileDir(scratch_dir), kProfileName),
      GenerateFirejailProfile(policy()));
}

absl::StatusOr<Command> FirejailSandbox::BuildCommand(
    const ExecutionRequest& request, const CallContext& call) {
  if (request.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  Command command;
  command.argv = BuildFirejailArgs(policy(), request, tool_path_,
                                   call.profile_dir, call.id,
                                   ResolveWorkDir(request, ""));
  command.envp = util::ToEnvStrings(ToolEnvironment(request));
  command.stdin_data = request.stdin_data;
  return command;
}

void FirejailSandbox::OnTimeout(absl::string_view call_id) {
  StartHelper({tool_path_, absl::StrCat("--shutdown=", call_id)});
}

}  // namespace procjail
