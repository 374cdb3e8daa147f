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

#include "procjail/probe.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "procjail/execution.h"
#include "procjail/flags.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"
#include "procjail/util/status_macros.h"

namespace procjail {

namespace {

constexpr size_t kMaxProbeOutput = 16 << 10;

absl::string_view FirstLine(absl::string_view text) {
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (!line.empty()) {
      return line;
    }
  }
  return "";
}

ExecutionResult RunBounded(absl::string_view tool_path,
                           const std::vector<std::string>& args,
                           size_t max_output_bytes) {
  Command command;
  command.argv.emplace_back(tool_path);
  command.argv.insert(command.argv.end(), args.begin(), args.end());
  command.envp = util::ToEnvStrings(util::MinimalEnvironment());
  OutputLimits limits;
  limits.timeout = absl::GetFlag(FLAGS_procjail_probe_timeout);
  limits.max_output_bytes = max_output_bytes;
  return RunCommand(std::move(command), limits);
}

}  // namespace

absl::StatusOr<std::string> LocateTool(absl::string_view tool) {
  return util::FindExecutable(
      tool, absl::GetFlag(FLAGS_procjail_runtime_search_path));
}

absl::StatusOr<std::string> ProbeToolVersion(
    absl::string_view tool, const std::vector<std::string>& args) {
  PROCJAIL_ASSIGN_OR_RETURN(std::string path, LocateTool(tool));
  ExecutionResult result = RunBounded(path, args, kMaxProbeOutput);
  if (!result.success) {
    VLOG(1) << "Probe of " << tool << " failed: " << result.ToString();
    return absl::UnavailableError(
        absl::StrCat(tool, " is not usable: ", result.ToString()));
  }
  absl::string_view version = FirstLine(result.stdout_data);
  if (version.empty()) {
    version = FirstLine(result.stderr_data);
  }
  return std::string(version);
}

absl::StatusOr<std::string> RunTool(absl::string_view tool_path,
                                    const std::vector<std::string>& args,
                                    size_t max_output_bytes) {
  ExecutionResult result = RunBounded(tool_path, args, max_output_bytes);
  if (!result.success) {
    VLOG(1) << tool_path << " failed: " << result.ToString() << ": "
            << result.stderr_data;
    return absl::UnavailableError(absl::StrCat(
        tool_path, " failed: ", result.ToString(), ": ",
        FirstLine(result.stderr_data)));
  }
  return std::move(result.stdout_data);
}

}  // namespace procjail
