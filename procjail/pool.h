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

// SandboxPool runs requests on a fixed set of pre-initialized sandboxes of
// one runtime. Each request gets an instance of its own for its duration;
// callers block while all instances are busy.

#ifndef PROCJAIL_POOL_H_
#define PROCJAIL_POOL_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/registry.h"
#include "procjail/sandbox.h"

namespace procjail {

struct PoolStats {
  // Instances owned by the pool.
  size_t total = 0;
  // Idle instances.
  size_t available = 0;
  // Callers blocked waiting for an instance.
  size_t waiting = 0;
  // Requests completed since the pool was created.
  size_t executed = 0;
};

class SandboxPool final {
 public:
  using SandboxFactory = absl::AnyInvocable<std::unique_ptr<Sandbox>()>;

  // Creates and initializes `size` sandboxes of `runtime`.
  static absl::StatusOr<std::unique_ptr<SandboxPool>> Create(
      SandboxRuntime runtime, const Policy& policy, size_t size);

  // Creates and initializes `size` sandboxes made by `factory`.
  static absl::StatusOr<std::unique_ptr<SandboxPool>> Create(
      SandboxFactory factory, size_t size);

  SandboxPool(const SandboxPool&) = delete;
  SandboxPool& operator=(const SandboxPool&) = delete;

  // Shuts the pool down if that has not happened yet.
  ~SandboxPool();

  // Runs `request` on an idle instance, waiting for one if necessary. Fails
  // with FAILED_PRECONDITION once the pool is shut down.
  absl::StatusOr<ExecutionResult> Execute(const ExecutionRequest& request)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Rejects new and waiting requests, kills running ones, waits for them to
  // finish and cleans up every instance. Returns the first cleanup error.
  // Idempotent.
  absl::Status Shutdown() ABSL_LOCKS_EXCLUDED(mutex_);

  PoolStats stats() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  explicit SandboxPool(std::vector<std::unique_ptr<Sandbox>> sandboxes);

  // Returns an idle instance, or nullptr if the pool was shut down meanwhile.
  Sandbox* Acquire() ABSL_LOCKS_EXCLUDED(mutex_);
  void Release(Sandbox* sandbox) ABSL_LOCKS_EXCLUDED(mutex_);

  const std::vector<std::unique_ptr<Sandbox>> sandboxes_;

  mutable absl::Mutex mutex_;
  std::vector<Sandbox*> idle_ ABSL_GUARDED_BY(mutex_);
  size_t waiting_ ABSL_GUARDED_BY(mutex_) = 0;
  size_t executed_ ABSL_GUARDED_BY(mutex_) = 0;
  bool shut_down_ ABSL_GUARDED_BY(mutex_) = false;
};

}  // namespace procjail

#endif  // PROCJAIL_POOL_H_
