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

#include "procjail/pool.h"

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/registry.h"
#include "procjail/sandbox.h"

namespace procjail {

absl::StatusOr<std::unique_ptr<SandboxPool>> SandboxPool::Create(
    SandboxRuntime runtime, const Policy& policy, size_t size) {
  return Create([runtime, policy] { return CreateSandbox(runtime, policy); },
                size);
}

absl::StatusOr<std::unique_ptr<SandboxPool>> SandboxPool::Create(
    SandboxFactory factory, size_t size) {
  if (size == 0) {
    return absl::InvalidArgumentError("Pool size must be positive");
  }
  std::vector<std::unique_ptr<Sandbox>> sandboxes;
  for (size_t i = 0; i < size; ++i) {
    std::unique_ptr<Sandbox> sandbox = factory();
    if (sandbox == nullptr) {
      return absl::InternalError("Sandbox factory returned nullptr");
    }
    if (absl::Status status = sandbox->Initialize(); !status.ok()) {
      LOG(ERROR) << "Could not initialize " << sandbox->name()
                 << " sandbox for the pool: " << status;
      sandbox->Cleanup().IgnoreError();
      for (auto& created : sandboxes) {
        created->Cleanup().IgnoreError();
      }
      return status;
    }
    sandboxes.push_back(std::move(sandbox));
  }
  LOG(INFO) << "Sandbox pool of " << size << " " << sandboxes[0]->name()
            << " instances ready";
  return absl::WrapUnique(new SandboxPool(std::move(sandboxes)));
}

SandboxPool::SandboxPool(std::vector<std::unique_ptr<Sandbox>> sandboxes)
    : sandboxes_(std::move(sandboxes)) {
  for (const auto& sandbox : sandboxes_) {
    idle_.push_back(sandbox.get());
  }
}

SandboxPool::~SandboxPool() { Shutdown().IgnoreError(); }

Sandbox* SandboxPool::Acquire() {
  absl::MutexLock lock(&mutex_);
  ++waiting_;
  auto idle_or_shut_down = [this]() {
    mutex_.AssertReaderHeld();
    return !idle_.empty() || shut_down_;
  };
  mutex_.Await(absl::Condition(&idle_or_shut_down));
  --waiting_;
  if (shut_down_) {
    return nullptr;
  }
  Sandbox* sandbox = idle_.back();
  idle_.pop_back();
  return sandbox;
}

void SandboxPool::Release(Sandbox* sandbox) {
  absl::MutexLock lock(&mutex_);
  ++executed_;
  idle_.push_back(sandbox);
}

absl::StatusOr<ExecutionResult> SandboxPool::Execute(
    const ExecutionRequest& request) {
  Sandbox* sandbox = Acquire();
  if (sandbox == nullptr) {
    return absl::FailedPreconditionError("Sandbox pool is shut down");
  }
  ExecutionResult result = sandbox->Execute(request);
  Release(sandbox);
  return result;
}

absl::Status SandboxPool::Shutdown() {
  {
    absl::MutexLock lock(&mutex_);
    if (shut_down_) {
      return absl::OkStatus();
    }
    shut_down_ = true;
  }
  for (const auto& sandbox : sandboxes_) {
    sandbox->Kill();
  }
  {
    // Killed requests still hand their instance back.
    absl::MutexLock lock(&mutex_);
    auto all_idle = [this]() {
      mutex_.AssertReaderHeld();
      return idle_.size() == sandboxes_.size();
    };
    mutex_.Await(absl::Condition(&all_idle));
  }
  absl::Status status;
  for (const auto& sandbox : sandboxes_) {
    status.Update(sandbox->Cleanup());
  }
  LOG(INFO) << "Sandbox pool shut down";
  return status;
}

PoolStats SandboxPool::stats() const {
  absl::MutexLock lock(&mutex_);
  PoolStats stats;
  stats.total = sandboxes_.size();
  stats.available = shut_down_ ? 0 : idle_.size();
  stats.waiting = waiting_;
  stats.executed = executed_;
  return stats;
}

}  // namespace procjail
