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

#include "procjail/registry.h"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "procjail/backends/bubblewrap.h"
#include "procjail/backends/container.h"
#include "procjail/backends/firejail.h"
#include "procjail/backends/gvisor.h"
#include "procjail/backends/macos.h"
#include "procjail/backends/nsjail.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/sandbox.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

constexpr SandboxRuntime kPreferenceOrder[] = {
    SandboxRuntime::kGVisor,     SandboxRuntime::kNsjail,
    SandboxRuntime::kBubblewrap, SandboxRuntime::kFirejail,
    SandboxRuntime::kDocker,     SandboxRuntime::kPodman,
    SandboxRuntime::kMacOs,
};

absl::StatusOr<std::string> RuntimeVersion(SandboxRuntime runtime) {
  switch (runtime) {
    case SandboxRuntime::kGVisor:
      return GVisorSandbox::Version();
    case SandboxRuntime::kNsjail:
      return NsjailSandbox::Version();
    case SandboxRuntime::kBubblewrap:
      return BubblewrapSandbox::Version();
    case SandboxRuntime::kFirejail:
      return FirejailSandbox::Version();
    case SandboxRuntime::kDocker:
      return ContainerSandbox::Version(ContainerRuntime::kDocker);
    case SandboxRuntime::kPodman:
      return ContainerSandbox::Version(ContainerRuntime::kPodman);
    case SandboxRuntime::kMacOs:
      return MacOsSandbox::Version();
  }
  return absl::InvalidArgumentError("Unknown runtime");
}

}  // namespace

absl::string_view ToString(SandboxRuntime runtime) {
  switch (runtime) {
    case SandboxRuntime::kGVisor:
      return "gvisor";
    case SandboxRuntime::kNsjail:
      return "nsjail";
    case SandboxRuntime::kBubblewrap:
      return "bubblewrap";
    case SandboxRuntime::kFirejail:
      return "firejail";
    case SandboxRuntime::kDocker:
      return "docker";
    case SandboxRuntime::kPodman:
      return "podman";
    case SandboxRuntime::kMacOs:
      return "macos";
  }
  return "unknown";
}

absl::StatusOr<SandboxRuntime> ParseSandboxRuntime(absl::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  for (SandboxRuntime runtime : kPreferenceOrder) {
    if (lower == ToString(runtime)) {
      return runtime;
    }
  }
  if (lower == "bwrap") {
    return SandboxRuntime::kBubblewrap;
  }
  if (lower == "runsc") {
    return SandboxRuntime::kGVisor;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown sandbox runtime: '", name, "'"));
}

bool AbslParseFlag(absl::string_view text, SandboxRuntime* runtime,
                   std::string* error) {
  absl::StatusOr<SandboxRuntime> parsed = ParseSandboxRuntime(text);
  if (!parsed.ok()) {
    *error = std::string(parsed.status().message());
    return false;
  }
  *runtime = *parsed;
  return true;
}

std::string AbslUnparseFlag(SandboxRuntime runtime) {
  return std::string(ToString(runtime));
}

absl::Span<const SandboxRuntime> RuntimePreferenceOrder() {
  return kPreferenceOrder;
}

RuntimeInfo DetectRuntime(SandboxRuntime runtime) {
  RuntimeInfo info;
  info.runtime = runtime;
  absl::StatusOr<std::string> version = RuntimeVersion(runtime);
  if (version.ok()) {
    info.available = true;
    info.version = *std::move(version);
  } else {
    VLOG(1) << ToString(runtime) << " is not available: " << version.status();
  }
  return info;
}

std::vector<RuntimeInfo> DetectRuntimes() {
  std::vector<RuntimeInfo> runtimes;
  for (SandboxRuntime runtime : kPreferenceOrder) {
    runtimes.push_back(DetectRuntime(runtime));
  }
  return runtimes;
}

std::unique_ptr<Sandbox> CreateSandbox(SandboxRuntime runtime, Policy policy) {
  switch (runtime) {
    case SandboxRuntime::kGVisor:
      return std::make_unique<GVisorSandbox>(std::move(policy));
    case SandboxRuntime::kNsjail:
      return std::make_unique<NsjailSandbox>(std::move(policy));
    case SandboxRuntime::kBubblewrap:
      return std::make_unique<BubblewrapSandbox>(std::move(policy));
    case SandboxRuntime::kFirejail:
      return std::make_unique<FirejailSandbox>(std::move(policy));
    case SandboxRuntime::kDocker:
      return std::make_unique<ContainerSandbox>(ContainerRuntime::kDocker,
                                                std::move(policy));
    case SandboxRuntime::kPodman:
      return std::make_unique<ContainerSandbox>(ContainerRuntime::kPodman,
                                                std::move(policy));
    case SandboxRuntime::kMacOs:
      return std::make_unique<MacOsSandbox>(std::move(policy));
  }
  return nullptr;
}

absl::StatusOr<SandboxRuntime> SelectRuntime(
    std::optional<SandboxRuntime> requested, bool fallback_enabled,
    absl::Span<const RuntimeInfo> detected) {
  auto is_available = [detected](SandboxRuntime runtime) {
    for (const RuntimeInfo& info : detected) {
      if (info.runtime == runtime) {
        return info.available;
      }
    }
    return false;
  };

  if (requested.has_value()) {
    if (is_available(*requested)) {
      return *requested;
    }
    if (!fallback_enabled) {
      return absl::NotFoundError(absl::StrCat(
          "Requested sandbox runtime is not available: ", ToString(*requested)));
    }
  }
  for (SandboxRuntime runtime : kPreferenceOrder) {
    if (is_available(runtime)) {
      if (requested.has_value()) {
        LOG(WARNING) << "Requested sandbox runtime " << ToString(*requested)
                     << " is not available, using " << ToString(runtime);
      }
      return runtime;
    }
  }
  std::vector<absl::string_view> names;
  for (SandboxRuntime runtime : kPreferenceOrder) {
    names.push_back(ToString(runtime));
  }
  return absl::NotFoundError(absl::StrCat("No sandbox runtime available (tried ",
                                          absl::StrJoin(names, ", "), ")"));
}

absl::StatusOr<SandboxRuntime> SelectRuntime(
    std::optional<SandboxRuntime> requested, bool fallback_enabled) {
  const std::vector<RuntimeInfo> detected = DetectRuntimes();
  return SelectRuntime(requested, fallback_enabled, detected);
}

absl::StatusOr<ExecutionResult> ExecuteInSandbox(
    const ExecutionRequest& request, Policy policy,
    std::optional<SandboxRuntime> runtime) {
  PROCJAIL_ASSIGN_OR_RETURN(SandboxRuntime selected,
                            SelectRuntime(runtime, /*fallback_enabled=*/true));
  LOG(INFO) << "Using sandbox runtime " << ToString(selected);
  std::unique_ptr<Sandbox> sandbox = CreateSandbox(selected, std::move(policy));
  // Cleanup() logs its own problems.
  absl::Cleanup cleanup = [&sandbox] { sandbox->Cleanup().IgnoreError(); };
  PROCJAIL_RETURN_IF_ERROR(sandbox->Initialize());
  return sandbox->Execute(request);
}

absl::StatusOr<int> ReapStaleContainers(absl::Duration max_age) {
  absl::Status status;
  int removed = 0;
  for (ContainerRuntime runtime :
       {ContainerRuntime::kDocker, ContainerRuntime::kPodman}) {
    if (!ContainerSandbox::IsAvailable(runtime)) {
      continue;
    }
    absl::StatusOr<int> reaped = ReapStaleContainers(runtime, max_age);
    if (!reaped.ok()) {
      LOG(WARNING) << "Reaping " << ToolName(runtime)
                   << " containers failed: " << reaped.status();
      status.Update(reaped.status());
      continue;
    }
    removed += *reaped;
  }
  if (!status.ok()) {
    return status;
  }
  return removed;
}

}  // namespace procjail
