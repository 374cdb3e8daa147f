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

#include "procjail/policy.h"

#include <cstdint>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/flags/marshalling.h"
#include "absl/status/status.h"
#include "absl/time/time.h"
#include "procjail/util/status_matchers.h"

namespace procjail {
namespace {

using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsTrue;
using ::testing::StrEq;

TEST(ParseMemoryQuantityTest, Units) {
  EXPECT_THAT(ParseMemoryQuantity("256Mi"), IsOkAndHolds(uint64_t{256} << 20));
  EXPECT_THAT(ParseMemoryQuantity("2Gi"), IsOkAndHolds(uint64_t{2} << 30));
  EXPECT_THAT(ParseMemoryQuantity("64Ki"), IsOkAndHolds(uint64_t{64} << 10));
  // Plain digits are MiB.
  EXPECT_THAT(ParseMemoryQuantity("512"), IsOkAndHolds(uint64_t{512} << 20));
}

TEST(ParseMemoryQuantityTest, RejectsMalformed) {
  for (const char* bad : {"", "Mi", "1.5Gi", "-1Mi", "256MB", "256 Mi", "1Ti",
                          "0x10"}) {
    SCOPED_TRACE(bad);
    EXPECT_THAT(ParseMemoryQuantity(bad),
                StatusIs(absl::StatusCode::kInvalidArgument));
  }
  EXPECT_THAT(ParseMemoryQuantity("99999999999999999Gi"),
              StatusIs(absl::StatusCode::kOutOfRange));
}

TEST(NetworkModeTest, ParseAndPrint) {
  EXPECT_THAT(ParseNetworkMode("none"), IsOkAndHolds(NetworkMode::kNone));
  EXPECT_THAT(ParseNetworkMode("restricted"),
              IsOkAndHolds(NetworkMode::kRestricted));
  EXPECT_THAT(ParseNetworkMode("host"), IsOkAndHolds(NetworkMode::kHost));
  EXPECT_THAT(ParseNetworkMode("bridge"), IsOkAndHolds(NetworkMode::kHost));
  EXPECT_THAT(ParseNetworkMode("wifi"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ToString(NetworkMode::kRestricted), StrEq("restricted"));
}

TEST(NetworkModeTest, FlagMarshalling) {
  NetworkMode mode = NetworkMode::kHost;
  std::string error;
  ASSERT_THAT(absl::ParseFlag("none", &mode, &error), IsTrue());
  EXPECT_THAT(mode, Eq(NetworkMode::kNone));
  EXPECT_FALSE(absl::ParseFlag("everything", &mode, &error));
  EXPECT_THAT(error, HasSubstr("everything"));
  EXPECT_THAT(absl::UnparseFlag(NetworkMode::kHost), StrEq("host"));
}

TEST(PolicyTest, Defaults) {
  Policy policy;
  EXPECT_THAT(policy.memory(), StrEq("256Mi"));
  EXPECT_THAT(policy.memory_bytes(), Eq(uint64_t{256} << 20));
  EXPECT_THAT(policy.memory_mib(), Eq(256));
  EXPECT_THAT(policy.cpu(), Eq(0.5));
  EXPECT_THAT(policy.network(), Eq(NetworkMode::kNone));
  EXPECT_THAT(policy.read_only(), IsTrue());
  EXPECT_THAT(policy.allowed_paths(), IsEmpty());
  EXPECT_THAT(policy.timeout(), Eq(absl::Seconds(30)));
  EXPECT_THAT(policy.max_output_bytes(), Eq(1 << 20));
  EXPECT_THAT(policy.work_dir(), IsEmpty());
  EXPECT_THAT(policy.ToString(), HasSubstr("network=none"));
}

}  // namespace
}  // namespace procjail
