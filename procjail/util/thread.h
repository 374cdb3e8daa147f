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

#ifndef PROCJAIL_UTIL_THREAD_H_
#define PROCJAIL_UTIL_THREAD_H_

#include <pthread.h>

#include <string>
#include <thread>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"

namespace procjail {

// Thin std::thread wrapper that names the thread (visible in ps, gdb and
// /proc/<pid>/task/*/comm), truncated to what the platform accepts.
class Thread {
 public:
  Thread() = default;

  Thread(const Thread&) = delete;
  Thread& operator=(const Thread&) = delete;

  Thread(Thread&&) = default;
  Thread& operator=(Thread&&) = default;

  Thread(absl::AnyInvocable<void() &&> functor, absl::string_view name = "") {
    thread_ = std::thread(
        [name = std::string(name), functor = std::move(functor)]() mutable {
          SetCurrentThreadName(name);
          std::move(functor)();
        });
  }

  template <class CL>
  Thread(CL* ptr, void (CL::*ptr_to_member)(), absl::string_view name = "")
      : Thread([ptr, ptr_to_member] { (ptr->*ptr_to_member)(); }, name) {}

  void Join() { thread_.join(); }

  bool IsJoinable() { return thread_.joinable(); }

 private:
  static void SetCurrentThreadName(const std::string& name) {
    if (name.empty()) {
      return;
    }
    // Linux limits names to 16 bytes including the terminator.
    std::string truncated = name.substr(0, 15);
#if defined(__APPLE__)
    pthread_setname_np(truncated.c_str());
#else
    pthread_setname_np(pthread_self(), truncated.c_str());
#endif
  }

  std::thread thread_;
};

}  // namespace procjail

#endif  // PROCJAIL_UTIL_THREAD_H_
