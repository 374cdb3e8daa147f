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

#include "procjail/subprocess.h"

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "absl/cleanup/cleanup.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/util.h"
#include "procjail/util/fileops.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

using ::procjail::file_util::fileops::FDCloser;

constexpr size_t kReadBufferSize = 64 << 10;

// Upper bound of a single poll(), so that a process which exited while one of
// its descendants keeps the output pipes open is still noticed.
constexpr absl::Duration kPollInterval = absl::Milliseconds(50);

absl::Status CreatePipe(FDCloser* read_end, FDCloser* write_end) {
  int fds[2];
#if defined(__linux__)
  if (pipe2(fds, O_CLOEXEC) == -1) {
    return absl::ErrnoToStatus(errno, "pipe2()");
  }
  *read_end = FDCloser(fds[0]);
  *write_end = FDCloser(fds[1]);
#else
  if (pipe(fds) == -1) {
    return absl::ErrnoToStatus(errno, "pipe()");
  }
  *read_end = FDCloser(fds[0]);
  *write_end = FDCloser(fds[1]);
  for (int fd : fds) {
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) {
      return absl::ErrnoToStatus(errno, "fcntl(FD_CLOEXEC)");
    }
  }
#endif
  return absl::OkStatus();
}

absl::Status SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return absl::ErrnoToStatus(errno, "fcntl(O_NONBLOCK)");
  }
  return absl::OkStatus();
}

// Spawns the command with the given descriptors as its standard streams. The
// child becomes the leader of a new process group and starts with an empty
// signal mask and default SIGPIPE disposition.
absl::StatusOr<pid_t> Spawn(const Command& command, int stdin_fd,
                            int stdout_fd, int stderr_fd) {
  posix_spawn_file_actions_t actions;
  if (int err = posix_spawn_file_actions_init(&actions); err != 0) {
    return absl::ErrnoToStatus(err, "posix_spawn_file_actions_init()");
  }
  absl::Cleanup actions_cleanup = [&actions] {
    posix_spawn_file_actions_destroy(&actions);
  };
  for (const auto& [fd, target] : {std::pair{stdin_fd, STDIN_FILENO},
                                   std::pair{stdout_fd, STDOUT_FILENO},
                                   std::pair{stderr_fd, STDERR_FILENO}}) {
    if (int err = posix_spawn_file_actions_adddup2(&actions, fd, target);
        err != 0) {
      return absl::ErrnoToStatus(err, "posix_spawn_file_actions_adddup2()");
    }
  }
  if (!command.cwd.empty()) {
    if (int err = posix_spawn_file_actions_addchdir_np(&actions,
                                                       command.cwd.c_str());
        err != 0) {
      return absl::ErrnoToStatus(err, "posix_spawn_file_actions_addchdir_np()");
    }
  }

  posix_spawnattr_t attr;
  if (int err = posix_spawnattr_init(&attr); err != 0) {
    return absl::ErrnoToStatus(err, "posix_spawnattr_init()");
  }
  absl::Cleanup attr_cleanup = [&attr] { posix_spawnattr_destroy(&attr); };
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  if (int err = posix_spawnattr_setflags(
          &attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                     POSIX_SPAWN_SETSIGDEF);
      err != 0) {
    return absl::ErrnoToStatus(err, "posix_spawnattr_setflags()");
  }
  if (int err = posix_spawnattr_setpgroup(&attr, 0); err != 0) {
    return absl::ErrnoToStatus(err, "posix_spawnattr_setpgroup()");
  }
  if (int err = posix_spawnattr_setsigmask(&attr, &empty_mask); err != 0) {
    return absl::ErrnoToStatus(err, "posix_spawnattr_setsigmask()");
  }
  if (int err = posix_spawnattr_setsigdefault(&attr, &default_signals);
      err != 0) {
    return absl::ErrnoToStatus(err, "posix_spawnattr_setsigdefault()");
  }

  util::CharPtrArray args = util::CharPtrArray::FromStringVector(command.argv);
  util::CharPtrArray envp = util::CharPtrArray::FromStringVector(command.envp);

  pid_t pid;
  if (int err = posix_spawnp(&pid, args.array()[0], &actions, &attr,
                             const_cast<char**>(args.data()),
                             const_cast<char**>(envp.data()));
      err != 0) {
    return absl::ErrnoToStatus(
        err, absl::StrCat("posix_spawnp(", command.argv[0], ")"));
  }
  return pid;
}

}  // namespace

Subprocess::Subprocess(Command command, OutputLimits limits)
    : command_(std::move(command)), limits_(limits) {}

Subprocess::~Subprocess() {
  if (thread_.IsJoinable()) {
    Kill();
    thread_.Join();
  }
}

bool Subprocess::RunAsync() {
  CHECK(!started_) << "RunAsync() called twice";
  started_ = true;
  start_ = absl::Now();

  auto fail = [this](const absl::Status& status) {
    LOG(WARNING) << "Could not run "
                 << (command_.argv.empty() ? "<empty>" : command_.argv[0])
                 << ": " << status;
    result_ = MakeErrorResult(std::string(status.message()),
                              absl::Now() - start_);
    done_.Notify();
    return false;
  };

  if (command_.argv.empty()) {
    return fail(absl::InvalidArgumentError("Empty command line"));
  }

  FDCloser child_stdin;
  FDCloser child_stdout;
  FDCloser child_stderr;
  absl::Status status = [&]() -> absl::Status {
    PROCJAIL_RETURN_IF_ERROR(CreatePipe(&child_stdin, &stdin_fd_));
    PROCJAIL_RETURN_IF_ERROR(CreatePipe(&stdout_fd_, &child_stdout));
    PROCJAIL_RETURN_IF_ERROR(CreatePipe(&stderr_fd_, &child_stderr));
    FDCloser wakeup_write;
    PROCJAIL_RETURN_IF_ERROR(CreatePipe(&wakeup_read_fd_, &wakeup_write));
    for (int fd : {stdin_fd_.get(), stdout_fd_.get(), stderr_fd_.get(),
                   wakeup_read_fd_.get(), wakeup_write.get()}) {
      PROCJAIL_RETURN_IF_ERROR(SetNonBlocking(fd));
    }
    absl::MutexLock lock(&wakeup_mutex_);
    wakeup_write_fd_ = std::move(wakeup_write);
    return absl::OkStatus();
  }();
  if (!status.ok()) {
    return fail(status);
  }

  VLOG(1) << "Spawning: " << absl::StrJoin(command_.argv, " ");
  absl::StatusOr<pid_t> pid = Spawn(command_, child_stdin.get(),
                                    child_stdout.get(), child_stderr.get());
  if (!pid.ok()) {
    return fail(pid.status());
  }
  pid_ = *pid;
  VLOG(1) << "Spawned pid " << pid_;

  // Only the child may hold these now, so that EOF is seen when it exits.
  child_stdin.Close();
  child_stdout.Close();
  child_stderr.Close();

  thread_ = Thread(this, &Subprocess::Monitor, "procjail-mon");
  return true;
}

ExecutionResult Subprocess::AwaitResult() {
  done_.WaitForNotification();
  if (thread_.IsJoinable()) {
    thread_.Join();
  }
  return result_;
}

void Subprocess::Kill() {
  kill_requested_ = true;
  // Before RunAsync() there is no pipe yet: the monitor checks the flag first.
  absl::MutexLock lock(&wakeup_mutex_);
  if (wakeup_write_fd_.get() >= 0) {
    char c = 0;
    // A full pipe already holds a pending wakeup.
    if (write(wakeup_write_fd_.get(), &c, 1) == -1 && errno != EAGAIN) {
      PLOG(WARNING) << "Could not wake up the monitor of pid " << pid_;
    }
  }
}

void Subprocess::Monitor() {
  // Writing to a pipe whose reader is gone raises SIGPIPE in the writing
  // thread. Keep it blocked here so that the write fails with EPIPE instead.
  sigset_t sigpipe;
  sigemptyset(&sigpipe);
  sigaddset(&sigpipe, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &sigpipe, nullptr);

  PumpIo();
  stdin_fd_.Close();
  stdout_fd_.Close();
  stderr_fd_.Close();

  // Descendants that outlived the process still belong to its group. The
  // unreaped leader keeps the group id from being reused.
  KillProcessGroup();

  int wait_status = 0;
  pid_t ret;
  do {
    ret = waitpid(pid_, &wait_status, 0);
  } while (ret == -1 && errno == EINTR);
  if (ret == pid_) {
    if (WIFEXITED(wait_status)) {
      result_.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
      // No exit code: the process never reported one.
      result_.term_signal = WTERMSIG(wait_status);
    }
  } else {
    PLOG(ERROR) << "waitpid(" << pid_ << ")";
    result_.error = absl::StrCat("waitpid(", pid_, ") failed");
  }
  result_.duration = absl::Now() - start_;
  result_.Finalize();
  VLOG(1) << "pid " << pid_ << ": " << result_.ToString();
  done_.Notify();
}

void Subprocess::PumpIo() {
  const absl::Time deadline = start_ + limits_.timeout;
  absl::string_view pending_stdin;
  if (command_.stdin_data.has_value()) {
    pending_stdin = *command_.stdin_data;
  }
  if (pending_stdin.empty()) {
    stdin_fd_.Close();
  }

  for (;;) {
    CheckExited();
    if (exited_) {
      DrainAvailableOutput();
      return;
    }
    if (kill_requested_) {
      VLOG(1) << "Killing pid " << pid_ << " on request";
      result_.killed = true;
      KillProcessGroup();
      return;
    }
    const absl::Time now = absl::Now();
    if (now >= deadline) {
      LOG(WARNING) << "pid " << pid_ << " (" << command_.argv[0]
                   << ") timed out after "
                   << absl::FormatDuration(limits_.timeout);
      result_.timed_out = true;
      KillProcessGroup();
      if (on_timeout_) {
        on_timeout_();
      }
      return;
    }
    // Once all streams are closed only the wakeup pipe is polled, which still
    // bounds the wait by the deadline.
    pollfd fds[4];
    int nfds = 0;
    fds[nfds++] = {wakeup_read_fd_.get(), POLLIN, 0};
    const int stdin_index = stdin_fd_.get() >= 0 ? nfds : -1;
    if (stdin_index >= 0) {
      fds[nfds++] = {stdin_fd_.get(), POLLOUT, 0};
    }
    const int stdout_index = stdout_fd_.get() >= 0 ? nfds : -1;
    if (stdout_index >= 0) {
      fds[nfds++] = {stdout_fd_.get(), POLLIN, 0};
    }
    const int stderr_index = stderr_fd_.get() >= 0 ? nfds : -1;
    if (stderr_index >= 0) {
      fds[nfds++] = {stderr_fd_.get(), POLLIN, 0};
    }
    const int timeout_ms = static_cast<int>(std::max<int64_t>(
        1, absl::ToInt64Milliseconds(std::min(deadline - now, kPollInterval))));
    int ret = poll(fds, nfds, timeout_ms);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      absl::Status status = absl::ErrnoToStatus(errno, "poll()");
      LOG(ERROR) << status;
      result_.error = std::string(status.message());
      KillProcessGroup();
      return;
    }
    if (ret == 0) {
      continue;
    }

    if (fds[0].revents & POLLIN) {
      char buf[64];
      while (read(wakeup_read_fd_.get(), buf, sizeof(buf)) > 0) {
      }
    }
    if (stdin_index >= 0 && fds[stdin_index].revents != 0) {
      ssize_t n = write(stdin_fd_.get(), pending_stdin.data(),
                        std::min(pending_stdin.size(), kReadBufferSize));
      if (n > 0) {
        pending_stdin.remove_prefix(n);
        if (pending_stdin.empty()) {
          stdin_fd_.Close();
        }
      } else if (n == -1 && errno != EAGAIN && errno != EINTR) {
        // EPIPE: the process closed its stdin without reading everything.
        VLOG(1) << "pid " << pid_ << ": stdin closed early, "
                << pending_stdin.size() << " bytes not delivered";
        stdin_fd_.Close();
      }
    }
    if (stdout_index >= 0 && fds[stdout_index].revents != 0) {
      ReadOutput(stdout_fd_, &result_.stdout_data, &result_.stdout_truncated);
    }
    if (stderr_index >= 0 && fds[stderr_index].revents != 0) {
      ReadOutput(stderr_fd_, &result_.stderr_data, &result_.stderr_truncated);
    }
  }
}

void Subprocess::CheckExited() {
  if (exited_) {
    return;
  }
  siginfo_t info = {};
  if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
    exited_ = info.si_pid == pid_;
  } else if (errno != EINTR) {
    // Monitor() reports the failure when it tries to reap the process.
    PLOG(ERROR) << "waitid(" << pid_ << ")";
    exited_ = true;
  }
}

void Subprocess::DrainAvailableOutput() {
  while (stdout_fd_.get() >= 0 &&
         ReadOutput(stdout_fd_, &result_.stdout_data,
                    &result_.stdout_truncated)) {
  }
  while (stderr_fd_.get() >= 0 &&
         ReadOutput(stderr_fd_, &result_.stderr_data,
                    &result_.stderr_truncated)) {
  }
}

bool Subprocess::ReadOutput(FDCloser& fd, std::string* out, bool* truncated) {
  char buffer[kReadBufferSize];
  ssize_t n = read(fd.get(), buffer, sizeof(buffer));
  if (n > 0) {
    AppendOutput(buffer, n, out, truncated);
    return true;
  }
  if (n == 0) {
    fd.Close();
  } else if (errno != EAGAIN && errno != EINTR) {
    PLOG(WARNING) << "read() from pid " << pid_;
    fd.Close();
  }
  return false;
}

void Subprocess::AppendOutput(const char* data, size_t size, std::string* out,
                              bool* truncated) {
  const size_t room =
      limits_.max_output_bytes - std::min(out->size(), limits_.max_output_bytes);
  if (size > room) {
    *truncated = true;
    size = room;
  }
  out->append(data, size);
}

void Subprocess::KillProcessGroup() {
  if (killpg(pid_, SIGKILL) == -1 && errno != ESRCH && errno != EPERM) {
    PLOG(WARNING) << "killpg(" << pid_ << ", SIGKILL)";
  }
}

ExecutionResult RunCommand(Command command, OutputLimits limits,
                           absl::AnyInvocable<void()> on_timeout) {
  Subprocess process(std::move(command), limits);
  if (on_timeout) {
    process.set_on_timeout(std::move(on_timeout));
  }
  return process.Run();
}

}  // namespace procjail
