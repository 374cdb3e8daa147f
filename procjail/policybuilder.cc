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

#include "procjail/policybuilder.h"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "absl/algorithm/container.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "procjail/policy.h"
#include "procjail/util/path.h"

namespace procjail {

PolicyBuilder& PolicyBuilder::SetMemory(absl::string_view quantity) {
  absl::StatusOr<uint64_t> bytes = ParseMemoryQuantity(quantity);
  if (!bytes.ok()) {
    return SetError(bytes.status());
  }
  if (*bytes == 0) {
    return SetError(absl::InvalidArgumentError("Memory limit must be > 0"));
  }
  policy_.memory_ = std::string(quantity);
  policy_.memory_bytes_ = *bytes;
  return *this;
}

PolicyBuilder& PolicyBuilder::SetCpu(double cores) {
  if (!std::isfinite(cores) || cores <= 0) {
    return SetError(absl::InvalidArgumentError(
        absl::StrCat("CPU limit must be a positive number of cores, got ",
                     cores)));
  }
  policy_.cpu_ = cores;
  return *this;
}

PolicyBuilder& PolicyBuilder::SetNetwork(NetworkMode mode) {
  policy_.network_ = mode;
  return *this;
}

PolicyBuilder& PolicyBuilder::SetReadOnly(bool read_only) {
  policy_.read_only_ = read_only;
  return *this;
}

PolicyBuilder& PolicyBuilder::AddAllowedPath(absl::string_view path) {
  if (!file::IsAbsolutePath(path)) {
    return SetError(absl::InvalidArgumentError(
        absl::StrCat("Allowed path must be absolute: '", path, "'")));
  }
  std::string clean = file::CleanPath(path);
  if (clean == "/") {
    return SetError(
        absl::InvalidArgumentError("Exposing the host root is not allowed"));
  }
  if (absl::c_linear_search(policy_.allowed_paths_, clean)) {
    VLOG(1) << "Ignoring duplicate allowed path " << clean;
    return *this;
  }
  policy_.allowed_paths_.push_back(std::move(clean));
  return *this;
}

PolicyBuilder& PolicyBuilder::AddAllowedHost(absl::string_view host) {
  if (host.empty()) {
    return SetError(absl::InvalidArgumentError("Allowed host is empty"));
  }
  policy_.allowed_hosts_.emplace_back(host);
  return *this;
}

PolicyBuilder& PolicyBuilder::SetTimeout(absl::Duration timeout) {
  if (timeout <= absl::ZeroDuration() || timeout == absl::InfiniteDuration()) {
    return SetError(absl::InvalidArgumentError(absl::StrCat(
        "Timeout must be positive and finite, got ",
        absl::FormatDuration(timeout))));
  }
  policy_.timeout_ = timeout;
  return *this;
}

PolicyBuilder& PolicyBuilder::SetMaxOutputBytes(size_t bytes) {
  policy_.max_output_bytes_ = bytes;
  return *this;
}

PolicyBuilder& PolicyBuilder::SetWorkDir(absl::string_view dir) {
  if (!file::IsAbsolutePath(dir)) {
    return SetError(absl::InvalidArgumentError(
        absl::StrCat("Working directory must be absolute: '", dir, "'")));
  }
  policy_.work_dir_ = file::CleanPath(dir);
  return *this;
}

absl::StatusOr<Policy> PolicyBuilder::TryBuild() {
  if (!last_status_.ok()) {
    return last_status_;
  }
  if (already_built_) {
    return absl::FailedPreconditionError("Can only build policy once.");
  }
  if (!policy_.allowed_hosts_.empty() &&
      policy_.network_ != NetworkMode::kRestricted) {
    LOG(WARNING) << "Allowed hosts are only consulted with restricted "
                    "networking, ignoring them for network mode "
                 << ToString(policy_.network_);
  }
  already_built_ = true;
  return std::move(policy_);
}

PolicyBuilder& PolicyBuilder::SetError(const absl::Status& status) {
  LOG(ERROR) << status;
  if (last_status_.ok()) {
    last_status_ = status;
  }
  return *this;
}

}  // namespace procjail
