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


#include "procjail/audit.h"

#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/execution.h"

namespace procjail {

namespace {

std::string Quote(absl::string_view value) {
  return absl::StrCat("\"", absl::CEscape(value), "\"");
}

}  // namespace

absl::string_view AuditRecord::outcome() const {
  if (success) {
    return "success";
  }
  if (timed_out) {
    return "timeout";
  }
  if (killed) {
    return "killed";
  }
  if (error.has_value()) {
    return "error";
  }
  if (term_signal != 0) {
    return "signal";
  }
  return "failure";
}

std::string AuditRecord::ToString() const {
  std::string line = absl::StrCat(
      "actor=", Quote(actor), " runtime=", runtime,
      " call=", call_id.empty() ? "-" : call_id,
      " command=", Quote(absl::StrJoin(command, " ")), " outcome=", outcome(),
      " exit_code=", exit_code, " timed_out=", timed_out ? "true" : "false",
      " duration=", absl::FormatDuration(duration));
  if (term_signal != 0) {
    absl::StrAppend(&line, " signal=", term_signal);
  }
  if (error.has_value()) {
    absl::StrAppend(&line, " error=", Quote(*error));
  }
  return line;
}

AuditRecord MakeAuditRecord(const ExecutionRequest& request,
                            absl::string_view runtime,
                            absl::string_view call_id, absl::Time start,
                            const ExecutionResult& result) {
  AuditRecord record;
  record.start = start;
  record.actor = request.actor;
  record.runtime = std::string(runtime);
  record.call_id = std::string(call_id);
  record.command.reserve(request.args.size() + 1);
  record.command.push_back(request.command);
  record.command.insert(record.command.end(), request.args.begin(),
                        request.args.end());
  record.success = result.success;
  record.exit_code = result.exit_code;
  record.term_signal = result.term_signal;
  record.timed_out = result.timed_out;
  record.killed = result.killed;
  record.duration = result.duration;
  record.error = result.error;
  return record;
}

void LogAuditSink::Record(const AuditRecord& record) {
  LOG(INFO) << "audit: " << record.ToString();
}

}  // namespace procjail
