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

#ifndef PROCJAIL_UTIL_FILE_HELPERS_H_
#define PROCJAIL_UTIL_FILE_HELPERS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace procjail::file {

absl::Status GetContents(absl::string_view path, std::string* output);

// Writes content to path, truncating an existing file. The file is created
// with the given permission bits.
absl::Status SetContents(absl::string_view path, absl::string_view content,
                         int mode = 0600);

}  // namespace procjail::file

#endif  // PROCJAIL_UTIL_FILE_HELPERS_H_
