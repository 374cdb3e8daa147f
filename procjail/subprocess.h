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

// The procjail::Subprocess class runs one fully specified command line under a
// watchdog and collects its output. Every sandbox backend reduces to building
// a Command and handing it to a Subprocess.

#ifndef PROCJAIL_SUBPROCESS_H_
#define PROCJAIL_SUBPROCESS_H_

#include <sys/types.h>

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/attributes.h"
#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/util/fileops.h"
#include "procjail/util/thread.h"

namespace procjail {

struct Command {
  // argv[0] is looked up in the PATH of the calling process.
  std::vector<std::string> argv;
  // Complete environment of the new process, as KEY=VALUE strings.
  std::vector<std::string> envp;
  std::optional<std::string> stdin_data;
  // Working directory of the new process. Empty means inherit.
  std::string cwd;
};

struct OutputLimits {
  absl::Duration timeout = Policy::kDefaultTimeout;
  // Applied to stdout and stderr independently.
  size_t max_output_bytes = Policy::kDefaultMaxOutputBytes;
};

// Runs a single process in its own process group. A monitor thread feeds
// stdin, drains stdout and stderr up to the output ceiling, and enforces the
// timeout by killing the whole process group.
//
// Subprocess p(std::move(command), limits);
// p.RunAsync();
// ExecutionResult result = p.AwaitResult();
class Subprocess final {
 public:
  Subprocess(Command command, OutputLimits limits);

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  // Kills the process if it is still running and waits for the monitor.
  ~Subprocess();

  // Installs a hook that runs on the monitor thread when the watchdog fires,
  // right after the process group was signalled. The hook must not block for
  // long: the result is not resolved until it returns.
  void set_on_timeout(absl::AnyInvocable<void()> on_timeout) {
    on_timeout_ = std::move(on_timeout);
  }

  // Runs the process, blocking until there is a result.
  ABSL_MUST_USE_RESULT ExecutionResult Run() {
    RunAsync();
    return AwaitResult();
  }

  // Spawns the process and starts the monitor thread. Returns whether the
  // spawn succeeded. On failure AwaitResult() still returns a result with the
  // error set. Must be called at most once.
  bool RunAsync();

  // Waits for the process to finish and returns the execution result.
  ABSL_MUST_USE_RESULT ExecutionResult AwaitResult();

  // Requests termination of the process group. Can be called from any thread,
  // also before RunAsync(), in which case the process is killed as soon as it
  // is spawned. The result reports killed = true unless the process finished
  // (or timed out) first.
  void Kill() ABSL_LOCKS_EXCLUDED(wakeup_mutex_);

  // Returns the process id, or -1 if the process was never spawned.
  pid_t pid() const { return pid_; }

 private:
  // Body of the monitor thread.
  void Monitor();

  // Feeds stdin, drains the output pipes and enforces the deadline. Returns
  // once the output streams are closed, the process was reaped, or the
  // process was killed.
  void PumpIo();

  // Sets exited_ if the process has terminated. Does not block and does not
  // reap it: the zombie keeps the process group id reserved.
  void CheckExited();

  // Reads whatever is immediately available from the output pipes.
  void DrainAvailableOutput();

  // Reads once from `fd` into `out`. Closes `fd` on EOF or error. Returns
  // whether any data was read.
  bool ReadOutput(file_util::fileops::FDCloser& fd, std::string* out,
                  bool* truncated);

  // Sends SIGKILL to the process group.
  void KillProcessGroup();

  // Appends data to `out`, honoring the output ceiling.
  void AppendOutput(const char* data, size_t size, std::string* out,
                    bool* truncated);

  Command command_;
  OutputLimits limits_;
  absl::AnyInvocable<void()> on_timeout_;

  absl::Time start_;
  pid_t pid_ = -1;
  bool exited_ = false;
  bool started_ = false;

  file_util::fileops::FDCloser stdin_fd_;
  file_util::fileops::FDCloser stdout_fd_;
  file_util::fileops::FDCloser stderr_fd_;
  // Written to by Kill() to interrupt poll() in the monitor thread.
  file_util::fileops::FDCloser wakeup_read_fd_;
  absl::Mutex wakeup_mutex_;
  file_util::fileops::FDCloser wakeup_write_fd_ ABSL_GUARDED_BY(wakeup_mutex_);

  std::atomic<bool> kill_requested_ = false;
  ExecutionResult result_;
  Thread thread_;
  absl::Notification done_;
};

// Runs a command to completion. Never fails: errors are reported in the
// result.
ExecutionResult RunCommand(Command command, OutputLimits limits,
                           absl::AnyInvocable<void()> on_timeout = nullptr);

}  // namespace procjail

#endif  // PROCJAIL_SUBPROCESS_H_
