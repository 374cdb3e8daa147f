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

#include "procjail/backends/macos.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "procjail/config.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/probe.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"
#include "procjail/util/fileops.h"
#include "procjail/util/file_helpers.h"
#include "procjail/util/path.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

namespace fileops = ::procjail::file_util::fileops;

constexpr absl::string_view kTool = "sandbox-exec";

constexpr absl::string_view kProfileHeader = R"((version 1)

; Deny everything by default
(deny default)

(allow process-fork)
(allow process-exec)

; System locations and device nodes
(allow file-read*
  (subpath "/usr")
  (subpath "/bin")
  (subpath "/sbin")
  (subpath "/System")
  (subpath "/Library/Frameworks")
  (subpath "/private/var/db/dyld")
  (literal "/dev/null")
  (literal "/dev/zero")
  (literal "/dev/random")
  (literal "/dev/urandom"))

(allow file-read*
  (subpath "/tmp")
  (subpath "/private/tmp"))

(allow mach-lookup
  (global-name "com.apple.system.logger"))
(allow sysctl-read)
(allow signal (target self))
)";

// Quotes `path` as an SBPL string literal.
std::string Quote(absl::string_view path) {
  return absl::StrCat(
      "\"", absl::StrReplaceAll(path, {{"\\", "\\\\"}, {"\"", "\\\""}}), "\"");
}

}  // namespace

std::string GenerateSeatbeltProfile(const Policy& policy,
                                    absl::string_view writable_dir) {
  std::string profile(kProfileHeader);
  absl::StrAppend(&profile, "\n; Call scratch directories\n",
                  "(allow file-read* file-write* (subpath ",
                  Quote(writable_dir), "))\n");

  switch (policy.network()) {
    case NetworkMode::kNone:
      absl::StrAppend(&profile, "\n(deny network*)\n");
      break;
    case NetworkMode::kRestricted:
      // Web ports only, regardless of the allowed hosts.
      absl::StrAppend(&profile,
                      "\n(allow network-outbound (remote tcp \"*:80\") "
                      "(remote tcp \"*:443\"))\n");
      break;
    case NetworkMode::kHost:
      absl::StrAppend(&profile, "\n(allow network*)\n");
      break;
  }

  for (const std::string& path : policy.allowed_paths()) {
    absl::StrAppend(&profile,
                    policy.read_only() ? "(allow file-read* (subpath "
                                       : "(allow file-read* file-write* "
                                         "(subpath ",
                    Quote(path), "))\n");
  }
  return profile;
}

std::vector<std::string> BuildSeatbeltArgs(const ExecutionRequest& request,
                                           absl::string_view tool_path,
                                           absl::string_view profile_path) {
  std::vector<std::string> args = {std::string(tool_path), "-f",
                                   std::string(profile_path), request.command};
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

bool MacOsSandbox::IsAvailable() { return Version().ok(); }

absl::StatusOr<std::string> MacOsSandbox::Version() {
  if (!host_os::IsMacOs()) {
    return absl::FailedPreconditionError("sandbox-exec requires macOS");
  }
  PROCJAIL_RETURN_IF_ERROR(LocateTool(kTool).status());
  return "built-in";
}

absl::Status MacOsSandbox::CheckPrerequisites() {
  if (!host_os::IsMacOs()) {
    return absl::FailedPreconditionError(absl::StrCat(
        "sandbox-exec requires macOS, running on ", host_os::Name()));
  }
  PROCJAIL_ASSIGN_OR_RETURN(tool_path_, LocateTool(kTool));
  return absl::OkStatus();
}

absl::Status MacOsSandbox::SetUp(absl::string_view scratch_dir) {
  PROCJAIL_ASSIGN_OR_RETURN(std::string work_root,
                            fileops::RealPath(WorkRoot(scratch_dir)));
  return file::SetContents(
      file::JoinPath(ProfileDir(scratch_dir), kProfileName),
      GenerateSeatbeltProfile(policy(), work_root));
}

absl::StatusOr<Command> MacOsSandbox::BuildCommand(
    const ExecutionRequest& request, const CallContext& call) {
  if (request.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  Command command;
  command.argv = BuildSeatbeltArgs(
      request, tool_path_, file::JoinPath(call.profile_dir, kProfileName));
  // The host TMPDIR is not writable under the profile.
  EnvMap env = util::MergeEnvironment(util::MinimalEnvironment(),
                                      {{"TMPDIR", call.scratch_dir}});
  command.envp =
      util::ToEnvStrings(util::MergeEnvironment(std::move(env), request.env));
  command.stdin_data = request.stdin_data;
  command.cwd = ResolveWorkDir(request, call.scratch_dir);
  return command;
}

}  // namespace procjail
