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

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/time/time.h"

namespace procjail {

absl::string_view ToString(NetworkMode mode) {
  switch (mode) {
    case NetworkMode::kNone:
      return "none";
    case NetworkMode::kRestricted:
      return "restricted";
    case NetworkMode::kHost:
      return "host";
  }
  return "unknown";
}

absl::StatusOr<NetworkMode> ParseNetworkMode(absl::string_view text) {
  text = absl::StripAsciiWhitespace(text);
  if (text == "none") {
    return NetworkMode::kNone;
  }
  if (text == "restricted") {
    return NetworkMode::kRestricted;
  }
  if (text == "host" || text == "bridge") {
    return NetworkMode::kHost;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid network mode: '", text,
                   "' (expected none, restricted, host or bridge)"));
}

bool AbslParseFlag(absl::string_view text, NetworkMode* out,
                   std::string* error) {
  absl::StatusOr<NetworkMode> mode = ParseNetworkMode(text);
  if (!mode.ok()) {
    *error = std::string(mode.status().message());
    return false;
  }
  *out = *mode;
  return true;
}

std::string AbslUnparseFlag(NetworkMode mode) {
  return std::string(ToString(mode));
}

absl::StatusOr<uint64_t> ParseMemoryQuantity(absl::string_view quantity) {
  absl::string_view digits = quantity;
  uint64_t multiplier = Policy::kMiB;
  if (absl::ConsumeSuffix(&digits, "Ki")) {
    multiplier = uint64_t{1} << 10;
  } else if (absl::ConsumeSuffix(&digits, "Mi")) {
    multiplier = Policy::kMiB;
  } else if (absl::ConsumeSuffix(&digits, "Gi")) {
    multiplier = uint64_t{1} << 30;
  }
  uint64_t value;
  if (digits.empty() ||
      !std::all_of(digits.begin(), digits.end(), absl::ascii_isdigit) ||
      !absl::SimpleAtoi(digits, &value)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid memory quantity: '", quantity,
                     "' (expected <digits>[Ki|Mi|Gi])"));
  }
  if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
    return absl::OutOfRangeError(
        absl::StrCat("Memory quantity too large: '", quantity, "'"));
  }
  return value * multiplier;
}

std::string Policy::ToString() const {
  return absl::StrFormat(
      "memory=%s cpu=%g network=%s read_only=%s timeout=%s "
      "max_output_bytes=%d allowed_paths=[%s] allowed_hosts=[%s] work_dir=%s",
      memory_, cpu_, procjail::ToString(network_),
      read_only_ ? "true" : "false", absl::FormatDuration(timeout_),
      max_output_bytes_,
      absl::StrJoin(allowed_paths_, ","), absl::StrJoin(allowed_hosts_, ","),
      work_dir_.empty() ? "<default>" : work_dir_);
}

}  // namespace procjail
