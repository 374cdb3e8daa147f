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

#include "procjail/execution.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "procjail/util.h"

namespace procjail {

ExecutionResult& ExecutionResult::Finalize() {
  success = exit_code == 0 && !timed_out && !killed;
  return *this;
}

absl::Status ExecutionResult::ToStatus() const {
  if (timed_out) {
    return absl::DeadlineExceededError(ToString());
  }
  if (killed) {
    return absl::CancelledError(ToString());
  }
  if (error.has_value()) {
    return absl::UnavailableError(ToString());
  }
  if (term_signal != 0) {
    return absl::AbortedError(ToString());
  }
  if (exit_code == kNoExitCode) {
    return absl::UnavailableError(ToString());
  }
  if (exit_code != 0) {
    return absl::UnknownError(ToString());
  }
  return absl::OkStatus();
}

std::string ExecutionResult::ToString() const {
  std::string result;
  if (timed_out) {
    result = "Process TIMEOUT";
  } else if (killed) {
    result = "Process killed by user";
  } else if (term_signal != 0) {
    result = absl::StrCat("Process terminated with a SIGNAL - Signal: ",
                          util::GetSignalName(term_signal));
  } else if (exit_code == kNoExitCode) {
    result = "Process did not run";
  } else {
    result = absl::StrCat(success ? "OK" : "FAILED", " - Exit code: ",
                          exit_code);
  }
  if (error.has_value()) {
    absl::StrAppend(&result, " - Error: ", *error);
  }
  if (stdout_truncated || stderr_truncated) {
    absl::StrAppend(&result, " - Output truncated:",
                    stdout_truncated ? " stdout" : "",
                    stderr_truncated ? " stderr" : "");
  }
  absl::StrAppend(&result, " (", absl::FormatDuration(duration), ")");
  return result;
}

ExecutionResult MakeErrorResult(std::string error, absl::Duration duration) {
  ExecutionResult result;
  result.exit_code = ExecutionResult::kNoExitCode;
  result.error = std::move(error);
  result.duration = duration;
  result.Finalize();
  return result;
}

}  // namespace procjail
