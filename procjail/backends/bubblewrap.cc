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

#include "procjail/backends/bubblewrap.h"

#include <string>
#include <vector>

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
#include "procjail/util/fileops.h"
#include "procjail/util/path.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

namespace fileops = ::procjail::file_util::fileops;

constexpr absl::string_view kTool = "bwrap";

// Host directories the command needs to find its binaries and libraries.
constexpr absl::string_view kSystemDirs[] = {"/usr", "/bin", "/sbin", "/lib",
                                             "/lib32", "/lib64"};

// Name resolution and TLS trust store.
constexpr absl::string_view kSystemFiles[] = {
    "/etc/resolv.conf", "/etc/hosts", "/etc/nsswitch.conf", "/etc/ssl",
    "/etc/pki", "/etc/ca-certificates",
};

void AddBind(absl::string_view option, absl::string_view source,
             absl::string_view dest, std::vector<std::string>* args) {
  args->push_back(std::string(option));
  args->push_back(std::string(source));
  args->push_back(std::string(dest));
}

}  // namespace

std::vector<std::string> BuildBubblewrapArgs(const Policy& policy,
                                             const ExecutionRequest& request,
                                             absl::string_view tool_path,
                                             absl::string_view call_dir,
                                             absl::string_view work_dir) {
  std::vector<std::string> args = {std::string(tool_path), "--unshare-all"};
  // --unshare-all includes the network namespace; it is given back unless
  // networking is disabled.
  if (policy.network() != NetworkMode::kNone) {
    args.push_back("--share-net");
  }
  args.push_back("--die-with-parent");

  // /usr is mandatory, the rest depends on the distribution's layout.
  AddBind("--ro-bind", "/usr", "/usr", &args);
  for (absl::string_view dir : kSystemDirs) {
    if (dir != "/usr") {
      AddBind("--ro-bind-try", dir, dir, &args);
    }
  }
  for (absl::string_view file : kSystemFiles) {
    AddBind("--ro-bind-try", file, file, &args);
  }

  args.insert(args.end(), {"--proc", "/proc", "--dev", "/dev"});

  // Writable even under a read-only policy; --remount-ro below does not
  // descend into these mounts.
  AddBind("--bind", file::JoinPath(call_dir, "tmp"), "/tmp", &args);
  AddBind("--bind", file::JoinPath(call_dir, "home"),
          BubblewrapSandbox::kHomeDir, &args);
  args.insert(args.end(),
              {"--setenv", "HOME", std::string(BubblewrapSandbox::kHomeDir),
               "--setenv", "TMPDIR", "/tmp"});

  args.insert(args.end(),
              {"--hostname", "sandbox", "--uid",
               absl::StrCat(BubblewrapSandbox::kSandboxUid), "--gid",
               absl::StrCat(BubblewrapSandbox::kSandboxGid)});
  args.insert(args.end(), {"--chdir", std::string(work_dir)});

  for (const std::string& path : policy.allowed_paths()) {
    AddBind(policy.read_only() ? "--ro-bind" : "--bind", path, path, &args);
  }
  for (const auto& [key, value] : request.env) {
    args.insert(args.end(), {"--setenv", key, value});
  }
  if (policy.read_only()) {
    // Must come after all mounts below /.
    args.insert(args.end(), {"--remount-ro", "/"});
  }

  args.push_back("--");
  args.push_back(request.command);
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

bool BubblewrapSandbox::IsAvailable() { return Version().ok(); }

absl::StatusOr<std::string> BubblewrapSandbox::Version() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError("bubblewrap requires Linux");
  }
  return ProbeToolVersion(kTool);
}

absl::Status BubblewrapSandbox::CheckPrerequisites() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError(
        absl::StrCat("bubblewrap requires Linux, running on ",
                     host_os::Name()));
  }
  PROCJAIL_ASSIGN_OR_RETURN(tool_path_, LocateTool(kTool));
  return absl::OkStatus();
}

absl::StatusOr<Command> BubblewrapSandbox::BuildCommand(
    const ExecutionRequest& request, const CallContext& call) {
  if (request.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  for (absl::string_view sub : {"tmp", "home"}) {
    PROCJAIL_RETURN_IF_ERROR(fileops::CreateDirectories(
        file::JoinPath(call.scratch_dir, sub), 0700));
  }
  Command command;
  command.argv = BuildBubblewrapArgs(policy(), request, tool_path_,
                                     call.scratch_dir,
                                     ResolveWorkDir(request, "/tmp"));
  command.envp = util::ToEnvStrings(ToolEnvironment(request));
  command.stdin_data = request.stdin_data;
  return command;
}

}  // namespace procjail
