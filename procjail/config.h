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

#ifndef PROCJAIL_CONFIG_H_
#define PROCJAIL_CONFIG_H_

#include <cstdint>

#include "absl/strings/string_view.h"

namespace procjail {

namespace os {

// Operating Systems known to procjail
enum Platform : uint16_t {
  kUnknown,
  kLinux,
  kMacOs,
};

}  // namespace os

namespace host_os {

// Returns the current host OS platform if supported. If not supported,
// returns os::kUnknown.
constexpr os::Platform Platform() {
#if defined(__linux__)
  return os::kLinux;
#elif defined(__APPLE__)
  return os::kMacOs;
#else
  return os::kUnknown;
#endif
}

constexpr bool IsLinux() { return Platform() == os::kLinux; }

constexpr bool IsMacOs() { return Platform() == os::kMacOs; }

constexpr absl::string_view Name() {
  switch (Platform()) {
    case os::kLinux:
      return "linux";
    case os::kMacOs:
      return "darwin";
    default:
      return "unknown";
  }
}

}  // namespace host_os

static_assert(host_os::Platform() != os::kUnknown,
              "Host OS is not supported: Linux or macOS is required.");

}  // namespace procjail

#endif  // PROCJAIL_CONFIG_H_
