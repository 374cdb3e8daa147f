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

#include <signal.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/time/time.h"
#include "procjail/execution.h"

namespace procjail {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StrEq;

ExecutionRequest EchoRequest() {
  ExecutionRequest request;
  request.command = "echo";
  request.args = {"a b", "c"};
  request.actor = "ci";
  return request;
}

TEST(AuditRecordTest, CopiesRequestAndResult) {
  ExecutionResult result;
  result.exit_code = 0;
  result.duration = absl::Milliseconds(12);
  result.Finalize();
  const absl::Time start = absl::FromUnixSeconds(1700000000);
  AuditRecord record =
      MakeAuditRecord(EchoRequest(), "bubblewrap", "procjail-x-1", start,
                      result);
  EXPECT_THAT(record.start, Eq(start));
  EXPECT_THAT(record.actor, StrEq("ci"));
  EXPECT_THAT(record.runtime, StrEq("bubblewrap"));
  EXPECT_THAT(record.call_id, StrEq("procjail-x-1"));
  EXPECT_THAT(record.command, ElementsAre("echo", "a b", "c"));
  EXPECT_THAT(record.outcome(), StrEq("success"));
  EXPECT_THAT(record.ToString(),
              StrEq("actor=\"ci\" runtime=bubblewrap call=procjail-x-1 "
                    "command=\"echo a b c\" outcome=success exit_code=0 "
                    "timed_out=false duration=12ms"));
}

TEST(AuditRecordTest, Outcomes) {
  AuditRecord record;
  EXPECT_THAT(record.outcome(), StrEq("failure"));
  record.term_signal = SIGKILL;
  EXPECT_THAT(record.outcome(), StrEq("signal"));
  record.error = "spawn failed";
  EXPECT_THAT(record.outcome(), StrEq("error"));
  record.killed = true;
  EXPECT_THAT(record.outcome(), StrEq("killed"));
  // A watchdog kill is reported as a timeout.
  record.timed_out = true;
  EXPECT_THAT(record.outcome(), StrEq("timeout"));
}

TEST(AuditRecordTest, EscapesFreeFormValues) {
  AuditRecord record;
  record.actor = "eve\" outcome=success";
  record.runtime = "nsjail";
  record.command = {"sh", "-c", "echo\nhi"};
  record.term_signal = SIGTERM;
  record.error = "bad \"thing\"";
  const std::string line = record.ToString();
  EXPECT_THAT(line, HasSubstr("actor=\"eve\\\" outcome=success\""));
  EXPECT_THAT(line, HasSubstr("call=- "));
  EXPECT_THAT(line, HasSubstr("command=\"sh -c echo\\nhi\""));
  EXPECT_THAT(line, HasSubstr(" outcome=error "));
  EXPECT_THAT(line, HasSubstr(" exit_code=-1 "));
  EXPECT_THAT(line, HasSubstr(" signal=15"));
  EXPECT_THAT(line, HasSubstr(" error=\"bad \\\"thing\\\"\""));
  EXPECT_THAT(line, Not(HasSubstr("\n")));
}

}  // namespace
}  // namespace procjail
