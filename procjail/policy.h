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

// The procjail::Policy class describes the isolation and resource envelope of
// a sandbox instance. Policies are created with procjail::PolicyBuilder and
// are immutable afterwards.

#ifndef PROCJAIL_POLICY_H_
#define PROCJAIL_POLICY_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace procjail {

enum class NetworkMode {
  // No network access at all.
  kNone,
  // Coarse, backend-specific approximation of an allow-list of remote hosts.
  // Never grants more than kHost, and is explicitly weaker than a firewall.
  kRestricted,
  // Unrestricted access through the host network.
  kHost,
};

absl::string_view ToString(NetworkMode mode);

// Accepts "none", "restricted", "host" and "bridge" (an alias of "host").
absl::StatusOr<NetworkMode> ParseNetworkMode(absl::string_view text);

bool AbslParseFlag(absl::string_view text, NetworkMode* out,
                   std::string* error);
std::string AbslUnparseFlag(NetworkMode mode);

// Parses a memory quantity of the form <digits>[Ki|Mi|Gi]. Plain digits are
// MiB. Returns the quantity in bytes.
absl::StatusOr<uint64_t> ParseMemoryQuantity(absl::string_view quantity);

class Policy final {
 public:
  static constexpr uint64_t kMiB = uint64_t{1} << 20;

  static constexpr absl::string_view kDefaultMemory = "256Mi";
  static constexpr double kDefaultCpu = 0.5;
  static constexpr absl::Duration kDefaultTimeout = absl::Seconds(30);
  static constexpr size_t kDefaultMaxOutputBytes = 1 << 20;

  // Returns a policy with the default limits: 256Mi of memory, half a core,
  // no network, read-only root, a 30 second timeout and 1 MiB of output per
  // stream.
  Policy() = default;

  Policy(const Policy&) = default;
  Policy& operator=(const Policy&) = default;
  Policy(Policy&&) = default;
  Policy& operator=(Policy&&) = default;

  // Memory ceiling as originally specified (e.g. "256Mi").
  const std::string& memory() const { return memory_; }
  uint64_t memory_bytes() const { return memory_bytes_; }
  // Memory ceiling in MiB, rounded up.
  uint64_t memory_mib() const { return (memory_bytes_ + kMiB - 1) / kMiB; }

  double cpu() const { return cpu_; }
  NetworkMode network() const { return network_; }
  bool read_only() const { return read_only_; }
  const std::vector<std::string>& allowed_paths() const {
    return allowed_paths_;
  }
  const std::vector<std::string>& allowed_hosts() const {
    return allowed_hosts_;
  }
  absl::Duration timeout() const { return timeout_; }
  size_t max_output_bytes() const { return max_output_bytes_; }
  // Empty when the backend should use its own default.
  const std::string& work_dir() const { return work_dir_; }

  std::string ToString() const;

 private:
  friend class PolicyBuilder;

  std::string memory_{kDefaultMemory};
  uint64_t memory_bytes_ = 256 * kMiB;
  double cpu_ = kDefaultCpu;
  NetworkMode network_ = NetworkMode::kNone;
  bool read_only_ = true;
  std::vector<std::string> allowed_paths_;
  std::vector<std::string> allowed_hosts_;
  absl::Duration timeout_ = kDefaultTimeout;
  size_t max_output_bytes_ = kDefaultMaxOutputBytes;
  std::string work_dir_;
};

}  // namespace procjail

#endif  // PROCJAIL_POLICY_H_
