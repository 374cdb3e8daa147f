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

#ifndef PROCJAIL_POLICYBUILDER_H_
#define PROCJAIL_POLICYBUILDER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/policy.h"

namespace procjail {

// PolicyBuilder is a helper class to simplify creation of policies. The builder
// uses fluent interface for convenience and increased readability of policies.
//
// For instance this would generate a policy for running a short script with
// access to a read-only data directory:
//
// Policy policy =
//     PolicyBuilder()
//       .SetMemory("512Mi")
//       .SetCpu(1)
//       .SetTimeout(absl::Seconds(10))
//       .AddAllowedPath("/srv/data")
//       .BuildOrDie();
//
// Setters validate their arguments. The first invalid argument is remembered
// and returned by TryBuild(); later setters are still applied but the policy
// cannot be built.
class PolicyBuilder final {
 public:
  PolicyBuilder() = default;
  PolicyBuilder(const PolicyBuilder&) = delete;
  PolicyBuilder& operator=(const PolicyBuilder&) = delete;

  // Sets the memory ceiling from a quantity such as "256Mi", "1Gi" or "512"
  // (plain digits are MiB).
  PolicyBuilder& SetMemory(absl::string_view quantity);

  // Sets the CPU ceiling in (fractional) cores. Must be positive.
  PolicyBuilder& SetCpu(double cores);

  PolicyBuilder& SetNetwork(NetworkMode mode);

  // With read_only set (the default), the root filesystem, home and /tmp are
  // not writable and allowed paths are exposed read-only.
  PolicyBuilder& SetReadOnly(bool read_only);

  // Exposes a host path at the same location inside the sandbox. The path
  // must be absolute. Paths keep the order in which they were added;
  // duplicates are ignored.
  PolicyBuilder& AddAllowedPath(absl::string_view path);

  // Adds a remote host to the allow-list consulted by restricted networking.
  PolicyBuilder& AddAllowedHost(absl::string_view host);

  // Sets the wall-clock ceiling of a single execution. Must be positive.
  PolicyBuilder& SetTimeout(absl::Duration timeout);

  // Sets the ceiling applied independently to stdout and stderr.
  PolicyBuilder& SetMaxOutputBytes(size_t bytes);

  // Sets the default working directory inside the sandbox. Must be absolute.
  PolicyBuilder& SetWorkDir(absl::string_view dir);

  // Builds the policy, returning the first error encountered by a setter.
  // Can only be called once.
  absl::StatusOr<Policy> TryBuild();

  // Builds the policy, aborting on any error. Use TryBuild() when the
  // arguments come from untrusted input.
  Policy BuildOrDie() { return TryBuild().value(); }

 private:
  // Sets the error status, unless one was already recorded.
  PolicyBuilder& SetError(const absl::Status& status);

  Policy policy_;
  bool already_built_ = false;
  absl::Status last_status_;
};

}  // namespace procjail

#endif  // PROCJAIL_POLICYBUILDER_H_
