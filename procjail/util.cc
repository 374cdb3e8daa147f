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

#include "procjail/util.h"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "procjail/util/path.h"

namespace procjail::util {

namespace {

constexpr absl::string_view kDefaultPath =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

}  // namespace

CharPtrArray::CharPtrArray(const std::vector<std::string>& vec)
    : content_(absl::StrJoin(vec, absl::string_view("\0", 1))) {
  size_t len = 0;
  array_.reserve(vec.size() + 1);
  for (const std::string& str : vec) {
    array_.push_back(&content_[len]);
    len += str.size() + 1;
  }
  array_.push_back(nullptr);
}

CharPtrArray CharPtrArray::FromStringVector(
    const std::vector<std::string>& vec) {
  return CharPtrArray(vec);
}

EnvMap MinimalEnvironment() {
  EnvMap env;
  for (const char* name :
       {"PATH", "HOME", "USER", "LANG", "TMPDIR", "XDG_RUNTIME_DIR"}) {
    if (const char* value = getenv(name); value != nullptr) {
      env[name] = value;
    }
  }
  env.try_emplace("PATH", kDefaultPath);
  return env;
}

EnvMap MergeEnvironment(EnvMap base, const EnvMap& overrides) {
  for (const auto& [key, value] : overrides) {
    base.insert_or_assign(key, value);
  }
  return base;
}

std::vector<std::string> ToEnvStrings(const EnvMap& env) {
  std::vector<std::string> result;
  result.reserve(env.size());
  for (const auto& [key, value] : env) {
    result.push_back(absl::StrCat(key, "=", value));
  }
  return result;
}

absl::StatusOr<std::string> FindExecutable(absl::string_view name,
                                           absl::string_view search_path) {
  if (name.empty()) {
    return absl::InvalidArgumentError("Empty executable name");
  }
  if (name.find('/') != absl::string_view::npos) {
    std::string path(name);
    if (access(path.c_str(), X_OK) != 0) {
      return absl::ErrnoToStatus(errno, absl::StrCat("access(", path, ")"));
    }
    return path;
  }
  std::string path_env;
  if (search_path.empty()) {
    const char* host_path = getenv("PATH");
    path_env = host_path != nullptr ? host_path : std::string(kDefaultPath);
  } else {
    path_env = std::string(search_path);
  }
  for (absl::string_view dir :
       absl::StrSplit(path_env, ':', absl::SkipEmpty())) {
    std::string candidate = file::JoinPath(dir, name);
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return absl::NotFoundError(
      absl::StrCat("Executable '", name, "' not found in ", path_env));
}

std::string RandomHexToken(int length) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  absl::BitGen gen;
  std::string token(length, '0');
  for (char& c : token) {
    c = kHexDigits[absl::Uniform(gen, 0, 16)];
  }
  return token;
}

std::string GetSignalName(int signo) {
  absl::string_view name;
  switch (signo) {
    case SIGHUP:
      name = "SIGHUP";
      break;
    case SIGINT:
      name = "SIGINT";
      break;
    case SIGQUIT:
      name = "SIGQUIT";
      break;
    case SIGILL:
      name = "SIGILL";
      break;
    case SIGTRAP:
      name = "SIGTRAP";
      break;
    case SIGABRT:
      name = "SIGABRT";
      break;
    case SIGBUS:
      name = "SIGBUS";
      break;
    case SIGFPE:
      name = "SIGFPE";
      break;
    case SIGKILL:
      name = "SIGKILL";
      break;
    case SIGUSR1:
      name = "SIGUSR1";
      break;
    case SIGSEGV:
      name = "SIGSEGV";
      break;
    case SIGUSR2:
      name = "SIGUSR2";
      break;
    case SIGPIPE:
      name = "SIGPIPE";
      break;
    case SIGALRM:
      name = "SIGALRM";
      break;
    case SIGTERM:
      name = "SIGTERM";
      break;
    case SIGCHLD:
      name = "SIGCHLD";
      break;
    case SIGCONT:
      name = "SIGCONT";
      break;
    case SIGSTOP:
      name = "SIGSTOP";
      break;
    case SIGXCPU:
      name = "SIGXCPU";
      break;
    case SIGXFSZ:
      name = "SIGXFSZ";
      break;
    case SIGSYS:
      name = "SIGSYS";
      break;
    default:
#ifdef SIGRTMIN
      if (signo >= SIGRTMIN && signo <= SIGRTMAX) {
        return absl::StrFormat("SIGRT-%d [%d]", signo - SIGRTMIN, signo);
      }
#endif
      return absl::StrFormat("UNKNOWN_SIGNAL [%d]", signo);
  }
  return absl::StrFormat("%s [%d]", name, signo);
}

}  // namespace procjail::util
