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

#include "procjail/flags.h"

#include <string>

#include "absl/flags/flag.h"
#include "absl/time/time.h"

// procjail:sandbox
ABSL_FLAG(std::string, procjail_scratch_root, "",
          "Directory under which sandbox instances create their scratch "
          "directories (default: $TMPDIR or /tmp)");
ABSL_FLAG(absl::Duration, procjail_probe_timeout, absl::Seconds(5),
          "Wall time limit for runtime availability probes and for the "
          "backend-native stop and removal commands");
ABSL_FLAG(std::string, procjail_runtime_search_path, "",
          "Colon separated list of directories searched for the sandboxing "
          "tools (default: $PATH)");

// procjail/backends:container
ABSL_FLAG(std::string, procjail_container_image, "alpine:latest",
          "Image used by the docker and podman backends");
ABSL_FLAG(int, procjail_pids_limit, 128,
          "Maximum number of processes inside a container, applied "
          "regardless of the sandbox policy");
