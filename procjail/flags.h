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

#ifndef PROCJAIL_FLAGS_H_
#define PROCJAIL_FLAGS_H_

#include <string>

#include "absl/flags/declare.h"
#include "absl/time/time.h"

// procjail:sandbox
ABSL_DECLARE_FLAG(std::string, procjail_scratch_root);
ABSL_DECLARE_FLAG(absl::Duration, procjail_probe_timeout);
ABSL_DECLARE_FLAG(std::string, procjail_runtime_search_path);

// procjail/backends:container
ABSL_DECLARE_FLAG(std::string, procjail_container_image);
ABSL_DECLARE_FLAG(int, procjail_pids_limit);

#endif  // PROCJAIL_FLAGS_H_
