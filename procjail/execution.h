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

// This file defines the request and result types shared by every sandbox
// backend.

#ifndef PROCJAIL_EXECUTION_H_
#define PROCJAIL_EXECUTION_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "procjail/util.h"

namespace procjail {

// One call to Sandbox::Execute().
struct ExecutionRequest {
  std::string command;
  std::vector<std::string> args;
  // Fed to the process, then its standard input is closed. Without it the
  // process sees an empty, closed standard input.
  std::optional<std::string> stdin_data;
  // Merged into (not replacing) the sandbox's minimal environment.
  EnvMap env;
  // Overrides the policy's working directory.
  std::optional<std::string> work_dir;
  // Who asked for the execution. Only used for audit records.
  std::string actor;
};

// Outcome of one execution. Every backend produces the same shape, and every
// failure is encoded here rather than returned as an error.
struct ExecutionResult {
  static constexpr int kNoExitCode = -1;

  // True iff exit_code == 0 && !timed_out && !killed. Maintained by
  // Finalize().
  bool success = false;
  // Exit code of the process, kNoExitCode if it never reported one, which
  // includes a process terminated by a signal.
  int exit_code = kNoExitCode;
  // Signal that terminated the process, 0 if it exited normally or never ran.
  int term_signal = 0;
  std::string stdout_data;
  std::string stderr_data;
  // Set when the stream exceeded the output ceiling and was cut.
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  // The watchdog fired.
  bool timed_out = false;
  // Terminated on request outside the timeout path (Kill(), shutdown).
  bool killed = false;
  // Wall-clock time from the first spawn attempt to resolution.
  absl::Duration duration = absl::ZeroDuration();
  // Set when the execution could not be attempted or the driver failed.
  std::optional<std::string> error;

  // Recomputes `success` from the other fields. Must be called by whoever
  // produces a result, after all other fields are set.
  ExecutionResult& Finalize();

  // Converts the result into a status: OK on success, DEADLINE_EXCEEDED on
  // timeout, CANCELLED when killed, UNAVAILABLE when the process could not be
  // run, ABORTED when a signal terminated it and UNKNOWN for a non-zero exit.
  absl::Status ToStatus() const;

  // Returns a one-line description of the outcome.
  std::string ToString() const;
};

// Convenience constructor for a result describing a failure to run anything.
ExecutionResult MakeErrorResult(std::string error,
                                absl::Duration duration = absl::ZeroDuration());

}  // namespace procjail

#endif  // PROCJAIL_EXECUTION_H_
