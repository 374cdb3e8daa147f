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

// Discovery and selection of the isolation backends installed on the host.

#ifndef PROCJAIL_REGISTRY_H_
#define PROCJAIL_REGISTRY_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/sandbox.h"

namespace procjail {

enum class SandboxRuntime {
  kGVisor,
  kNsjail,
  kBubblewrap,
  kFirejail,
  kDocker,
  kPodman,
  kMacOs,
};

absl::string_view ToString(SandboxRuntime runtime);

// Parses a runtime name as printed by ToString(), e.g. "bubblewrap".
absl::StatusOr<SandboxRuntime> ParseSandboxRuntime(absl::string_view name);

bool AbslParseFlag(absl::string_view text, SandboxRuntime* runtime,
                   std::string* error);
std::string AbslUnparseFlag(SandboxRuntime runtime);

// All runtimes, strongest isolation first. Automatic selection picks the
// first available one.
absl::Span<const SandboxRuntime> RuntimePreferenceOrder();

struct RuntimeInfo {
  SandboxRuntime runtime;
  bool available = false;
  // Version reported by the tool, empty if unavailable.
  std::string version;
};

// Probes every runtime, in preference order.
std::vector<RuntimeInfo> DetectRuntimes();

// Probes a single runtime.
RuntimeInfo DetectRuntime(SandboxRuntime runtime);

// Creates an uninitialized sandbox of the given kind.
std::unique_ptr<Sandbox> CreateSandbox(SandboxRuntime runtime, Policy policy);

// Picks the runtime to use from the probe results in `detected`. Without a
// `requested` runtime the most preferred available one is chosen. A requested
// runtime that is unavailable is replaced by the most preferred available one
// if `fallback_enabled`, and is an error otherwise. Returns NOT_FOUND if no
// runtime is usable.
absl::StatusOr<SandboxRuntime> SelectRuntime(
    std::optional<SandboxRuntime> requested, bool fallback_enabled,
    absl::Span<const RuntimeInfo> detected);

// As above, probing the host.
absl::StatusOr<SandboxRuntime> SelectRuntime(
    std::optional<SandboxRuntime> requested, bool fallback_enabled = true);

// Runs a single request in a fresh sandbox that is always cleaned up
// afterwards. Fails only if no sandbox could be set up; the outcome of the
// command itself is in the result.
absl::StatusOr<ExecutionResult> ExecuteInSandbox(
    const ExecutionRequest& request, Policy policy,
    std::optional<SandboxRuntime> runtime = std::nullopt);

// Removes procjail containers older than `max_age` from every available
// container runtime. Returns the number removed, or the first error after
// trying all runtimes.
absl::StatusOr<int> ReapStaleContainers(absl::Duration max_age);

}  // namespace procjail

#endif  // PROCJAIL_REGISTRY_H_
