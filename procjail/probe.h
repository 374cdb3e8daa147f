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

// Helpers for locating the external sandboxing tools and checking that they
// actually run.

#ifndef PROCJAIL_PROBE_H_
#define PROCJAIL_PROBE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace procjail {

// Returns the absolute path of `tool`, searching --procjail_runtime_search_path
// (or $PATH when the flag is empty).
absl::StatusOr<std::string> LocateTool(absl::string_view tool);

// Runs `tool args...` bounded by --procjail_probe_timeout and returns the
// first non-empty line it printed (stdout first, then stderr). Fails if the
// tool cannot be found, does not exit with 0 or times out.
absl::StatusOr<std::string> ProbeToolVersion(
    absl::string_view tool,
    const std::vector<std::string>& args = {"--version"});

// Runs `tool_path args...` bounded by --procjail_probe_timeout and returns its
// standard output, cut at `max_output_bytes`. Fails unless the tool exits
// with 0.
absl::StatusOr<std::string> RunTool(absl::string_view tool_path,
                                    const std::vector<std::string>& args,
                                    size_t max_output_bytes = 1 << 20);

}  // namespace procjail

#endif  // PROCJAIL_PROBE_H_
