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

#include <signal.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/time/time.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

using ::testing::HasSubstr;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::StartsWith;

TEST(ExecutionResultTest, SuccessRequiresCleanZeroExit) {
  ExecutionResult result;
  result.exit_code = 0;
  EXPECT_THAT(result.Finalize().success, IsTrue());
  EXPECT_THAT(result.ToStatus(), IsOk());
  EXPECT_THAT(result.ToString(), StartsWith("OK - Exit code: 0"));

  result.exit_code = 3;
  EXPECT_THAT(result.Finalize().success, IsFalse());
  EXPECT_THAT(result.ToStatus(), StatusIs(absl::StatusCode::kUnknown));

  result.exit_code = 0;
  result.timed_out = true;
  EXPECT_THAT(result.Finalize().success, IsFalse());
  EXPECT_THAT(result.ToStatus(),
              StatusIs(absl::StatusCode::kDeadlineExceeded));

  result.timed_out = false;
  result.killed = true;
  EXPECT_THAT(result.Finalize().success, IsFalse());
  EXPECT_THAT(result.ToStatus(), StatusIs(absl::StatusCode::kCancelled));
}

TEST(ExecutionResultTest, DefaultResultIsNotSuccessful) {
  ExecutionResult result;
  EXPECT_THAT(result.Finalize().success, IsFalse());
  EXPECT_THAT(result.ToString(), StartsWith("Process did not run"));
}

TEST(ExecutionResultTest, ErrorResult) {
  ExecutionResult result =
      MakeErrorResult("posix_spawnp(): No such file or directory",
                      absl::Milliseconds(2));
  EXPECT_THAT(result.success, IsFalse());
  EXPECT_EQ(result.exit_code, ExecutionResult::kNoExitCode);
  EXPECT_THAT(result.ToStatus(),
              StatusIs(absl::StatusCode::kUnavailable,
                       HasSubstr("No such file or directory")));
}

TEST(ExecutionResultTest, DescribesSignalAndTruncation) {
  ExecutionResult result;
  result.term_signal = SIGSEGV;
  result.stdout_truncated = true;
  result.Finalize();
  EXPECT_THAT(result.success, IsFalse());
  EXPECT_THAT(result.ToString(), HasSubstr("SIGSEGV"));
  EXPECT_THAT(result.ToString(), HasSubstr("Output truncated: stdout"));
  EXPECT_THAT(result.ToStatus(), StatusIs(absl::StatusCode::kAborted));
}

}  // namespace
}  // namespace procjail
