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

// The procjail::util namespace provides various, uncategorized, functions
// useful for launching sandboxing tools.

#ifndef PROCJAIL_UTIL_H_
#define PROCJAIL_UTIL_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace procjail {

// Environment variables keyed by name. Ordered, so that generated command
// lines are deterministic.
using EnvMap = absl::btree_map<std::string, std::string>;

namespace util {

// An char ptr array limited by the terminating nullptr entry (like environ
// or argv), as expected by posix_spawn().
class CharPtrArray {
 public:
  static CharPtrArray FromStringVector(const std::vector<std::string>& vec);

  const std::vector<const char*>& array() const { return array_; }

  const char* const* data() const { return array_.data(); }

 private:
  CharPtrArray(const std::vector<std::string>& vec);

  const std::string content_;
  std::vector<const char*> array_;
};

// Returns the small subset of the host environment that sandboxing tools need
// to start up: PATH (with a sane default), HOME, USER, LANG, TMPDIR and
// XDG_RUNTIME_DIR (rootless container runtimes locate their state there).
EnvMap MinimalEnvironment();

// Returns `base` with every entry of `overrides` added or replacing the
// existing value.
EnvMap MergeEnvironment(EnvMap base, const EnvMap& overrides);

// Flattens an environment map into KEY=VALUE strings.
std::vector<std::string> ToEnvStrings(const EnvMap& env);

// Searches `search_path` (colon separated, falls back to $PATH when empty)
// for an executable named `name`. Names containing a slash are checked as-is.
absl::StatusOr<std::string> FindExecutable(absl::string_view name,
                                           absl::string_view search_path = {});

// Returns a random lowercase hexadecimal token of `length` characters.
std::string RandomHexToken(int length);

// Returns signal description.
std::string GetSignalName(int signo);

}  // namespace util
}  // namespace procjail

#endif  // PROCJAIL_UTIL_H_
