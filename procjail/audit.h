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


// Audit records describe every call that went through a sandbox: who asked,
// what ran where, and how it ended. Sandbox::Execute() hands one record per
// call to an AuditSink.

#ifndef PROCJAIL_AUDIT_H_
#define PROCJAIL_AUDIT_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/execution.h"

namespace procjail {

struct AuditRecord {
  absl::Time start = absl::InfinitePast();
  // Who asked for the execution, empty when unknown.
  std::string actor;
  // Backend name, e.g. "bubblewrap".
  std::string runtime;
  // Empty when the call failed before a call id was minted.
  std::string call_id;
  // Command followed by its arguments.
  std::vector<std::string> command;

  bool success = false;
  int exit_code = ExecutionResult::kNoExitCode;
  int term_signal = 0;
  bool timed_out = false;
  bool killed = false;
  absl::Duration duration = absl::ZeroDuration();
  std::optional<std::string> error;

  // One of "success", "timeout", "killed", "error", "signal" or "failure".
  absl::string_view outcome() const;

  // Single line of space separated key=value pairs. Free-form values are
  // quoted and C-escaped.
  std::string ToString() const;
};

AuditRecord MakeAuditRecord(const ExecutionRequest& request,
                            absl::string_view runtime,
                            absl::string_view call_id, absl::Time start,
                            const ExecutionResult& result);

// Receives the audit records of one or more sandboxes. Concurrent calls report
// concurrently: implementations must be thread-safe and must not call back
// into the reporting sandbox.
class AuditSink {
 public:
  virtual ~AuditSink() = default;

  virtual void Record(const AuditRecord& record) = 0;
};

// Default sink: one INFO log line per record.
class LogAuditSink final : public AuditSink {
 public:
  void Record(const AuditRecord& record) override;
};

}  // namespace procjail

#endif  // PROCJAIL_AUDIT_H_
