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

#include "procjail/backends/nsjail.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "google/protobuf/text_format.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/backends/nsjail_config.pb.h"
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

constexpr absl::string_view kTool = "nsjail";

constexpr uint64_t kMaxOpenFiles = 32;
constexpr absl::string_view kTmpfsOptions = "size=67108864";

// System calls a typical dynamically linked command needs (x86-64 names).
// Everything else kills the process.
constexpr absl::string_view kAllowedSyscalls[] = {
    "read, write, readv, writev, pread64, pwrite64, open, openat, close",
    "stat, fstat, lstat, newfstatat, statx, statfs, fstatfs, lseek",
    "access, faccessat, faccessat2, readlink, readlinkat, getdents",
    "getdents64, getcwd, chdir, fchdir, mkdir, mkdirat, rmdir, creat",
    "unlink, unlinkat, rename, renameat, chmod, fchmod, lchown, umask",
    "fcntl, flock, fsync, fdatasync, truncate, ftruncate, ioctl, utimensat",
    "mmap, mprotect, munmap, brk, mremap, mincore, madvise",
    "pipe, pipe2, dup, dup2, dup3, select, pselect6, poll, ppoll",
    "epoll_create1, epoll_ctl, epoll_wait, epoll_pwait, eventfd2",
    "socket, connect, sendto, recvfrom, sendmsg, recvmsg, shutdown",
    "getsockname, getpeername, getsockopt, setsockopt",
    "clone, clone3, fork, vfork, execve, exit, exit_group, wait4, kill",
    "tgkill, rt_sigaction, rt_sigprocmask, rt_sigreturn, sigaltstack",
    "getpid, gettid, getppid, getpgrp, setpgid, setsid, getuid, getgid",
    "geteuid, getegid, setreuid, setregid, uname, sysinfo, getrlimit",
    "prlimit64, getrusage, arch_prctl, prctl, set_tid_address",
    "set_robust_list, futex, rseq, sched_yield, sched_getaffinity",
    "nanosleep, clock_nanosleep, clock_gettime, clock_getres",
    "gettimeofday, getrandom",
};

void AddBindMount(absl::string_view path, bool rw, bool mandatory,
                  nsjail::NsJailConfig* config) {
  nsjail::MountPt* mount = config->add_mount();
  mount->set_src(std::string(path));
  mount->set_dst(std::string(path));
  mount->set_is_bind(true);
  mount->set_rw(rw);
  if (!mandatory) {
    mount->set_mandatory(false);
  }
}

uint64_t CeilDiv(uint64_t value, uint64_t unit) {
  return (value + unit - 1) / unit;
}

}  // namespace

nsjail::NsJailConfig BuildNsjailConfig(const Policy& policy) {
  nsjail::NsJailConfig config;
  config.set_name("procjail");
  config.set_mode(nsjail::ONCE);
  config.set_hostname("sandbox");
  config.set_time_limit(static_cast<uint32_t>(
      absl::ToInt64Seconds(absl::Ceil(policy.timeout(), absl::Seconds(1)))));

  config.set_rlimit_as(policy.memory_mib());
  config.set_rlimit_cpu(static_cast<uint64_t>(std::ceil(policy.cpu() * 60)));
  config.set_rlimit_fsize(
      std::max<uint64_t>(1, CeilDiv(policy.max_output_bytes(), Policy::kMiB)));
  config.set_rlimit_nofile(kMaxOpenFiles);

  config.set_clone_newnet(policy.network() == NetworkMode::kNone);
  config.set_clone_newuser(true);
  config.set_clone_newns(true);
  config.set_clone_newpid(true);
  config.set_clone_newipc(true);
  config.set_clone_newuts(true);

  AddBindMount("/bin", /*rw=*/false, /*mandatory=*/true, &config);
  AddBindMount("/lib", /*rw=*/false, /*mandatory=*/true, &config);
  AddBindMount("/lib64", /*rw=*/false, /*mandatory=*/false, &config);
  AddBindMount("/usr", /*rw=*/false, /*mandatory=*/true, &config);
  AddBindMount("/dev/null", /*rw=*/true, /*mandatory=*/true, &config);
  AddBindMount("/dev/zero", /*rw=*/false, /*mandatory=*/true, &config);
  AddBindMount("/dev/urandom", /*rw=*/false, /*mandatory=*/true, &config);

  nsjail::MountPt* proc = config.add_mount();
  proc->set_dst("/proc");
  proc->set_fstype("proc");

  nsjail::MountPt* tmp = config.add_mount();
  tmp->set_dst("/tmp");
  tmp->set_fstype("tmpfs");
  tmp->set_options(std::string(kTmpfsOptions));
  tmp->set_rw(!policy.read_only());
  tmp->set_is_dir(true);

  for (const std::string& path : policy.allowed_paths()) {
    AddBindMount(path, /*rw=*/!policy.read_only(), /*mandatory=*/true, &config);
  }

  config.add_seccomp_string("ALLOW {");
  for (absl::string_view line : kAllowedSyscalls) {
    config.add_seccomp_string(absl::StrCat("  ", line, ","));
  }
  // The last entry must not end with a comma.
  std::string* last =
      config.mutable_seccomp_string(config.seccomp_string_size() - 1);
  last->pop_back();
  config.add_seccomp_string("}");
  config.add_seccomp_string("DEFAULT KILL");
  return config;
}

absl::StatusOr<std::string> RenderNsjailConfig(
    const nsjail::NsJailConfig& config) {
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(config, &text)) {
    return absl::InternalError("Could not render the nsjail configuration");
  }
  return text;
}

std::vector<std::string> BuildNsjailArgs(const ExecutionRequest& request,
                                         const EnvMap& env,
                                         absl::string_view tool_path,
                                         absl::string_view config_path,
                                         absl::string_view work_dir,
                                         absl::string_view executable) {
  std::vector<std::string> args = {std::string(tool_path), "--config",
                                   std::string(config_path), "--quiet"};
  // nsjail starts the command with an empty environment.
  for (const auto& [key, value] : env) {
    args.push_back("--env");
    args.push_back(absl::StrCat(key, "=", value));
  }
  args.push_back("--cwd");
  args.push_back(std::string(work_dir));
  args.push_back("--");
  args.push_back(std::string(executable));
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

NsjailSandbox::NsjailSandbox(Policy policy) : Sandbox(std::move(policy)) {
  if (this->policy().network() == NetworkMode::kRestricted) {
    LOG(WARNING) << "nsjail: restricted networking shares the host network, "
                    "allowed hosts are not enforced";
  }
}

bool NsjailSandbox::IsAvailable() { return Version().ok(); }

absl::StatusOr<std::string> NsjailSandbox::Version() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError("nsjail requires Linux");
  }
  return ProbeToolVersion(kTool);
}

absl::Status NsjailSandbox::CheckPrerequisites() {
  if (!host_os::IsLinux()) {
    return absl::FailedPreconditionError(
        absl::StrCat("nsjail requires Linux, running on ", host_os::Name()));
  }
  PROCJAIL_ASSIGN_OR_RETURN(tool_path_, LocateTool(kTool));
  return absl::OkStatus();
}

absl::Status NsjailSandbox::SetUp(absl::string_view scratch_dir) {
  PROCJAIL_ASSIGN_OR_RETURN(std::string text,
                            RenderNsjailConfig(BuildNsjailConfig(policy())));
  return file::SetContents(
      file::JoinPath(ProfileDir(scratch_dir), kConfigName), text);
}

absl::StatusOr<Command> NsjailSandbox::BuildCommand(
    const ExecutionRequest& request, const CallContext& call) {
  if (request.command.empty()) {
    return absl::InvalidArgumentError("Empty command");
  }
  EnvMap env = util::MinimalEnvironment();
  // Host directories are mounted at the same place inside the jail, a host
  // lookup finds the same binary.
  PROCJAIL_ASSIGN_OR_RETURN(
      std::string executable,
      util::FindExecutable(request.command, env["PATH"]));

  EnvMap jail_env = {
      {"PATH", env["PATH"]}, {"HOME", "/tmp"}, {"TMPDIR", "/tmp"}};
  if (auto it = env.find("LANG"); it != env.end()) {
    jail_env.insert(*it);
  }
  jail_env = util::MergeEnvironment(std::move(jail_env), request.env);

  Command command;
  command.argv = BuildNsjailArgs(request, jail_env, tool_path_,
                                 file::JoinPath(call.profile_dir, kConfigName),
                                 ResolveWorkDir(request, "/tmp"), executable);
  command.envp = util::ToEnvStrings(env);
  command.stdin_data = request.stdin_data;
  return command;
}

}  // namespace procjail
