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

// The procjail::Sandbox class is the common interface of every isolation
// backend. A backend only decides how a Policy and an ExecutionRequest turn
// into a command line (and, for profile based tools, a profile written at
// initialization). Spawning, the watchdog, output capture, scratch space and
// teardown are handled here.

#ifndef PROCJAIL_SANDBOX_H_
#define PROCJAIL_SANDBOX_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "procjail/audit.h"
#include "procjail/execution.h"
#include "procjail/policy.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"

namespace procjail {

// State of one Execute() call, handed to the backend.
struct CallContext {
  // Unique per call, meant for naming containers and jails.
  std::string id;
  // Host directory private to the call. Created empty before BuildCommand()
  // and removed when the call returns.
  std::string scratch_dir;
  // Directory holding the files written by SetUp().
  std::string profile_dir;
};

// Lifecycle:
//
//   std::unique_ptr<Sandbox> sandbox = CreateSandbox(runtime, policy);
//   absl::Cleanup cleanup = [&] { sandbox->Cleanup().IgnoreError(); };
//   ExecutionResult result = sandbox->Execute(request);
//
// Execute() may be called concurrently on one instance: every call mints its
// own identifier for named container/jail resources and gets a scratch
// subdirectory of its own. The instance scratch directory is laid out as
//
//   <scratch>/profile/          written by SetUp(), never writable by a call
//   <scratch>/work/<call id>/   CallContext::scratch_dir
class Sandbox {
 public:
  static constexpr absl::string_view kProfileSubdir = "profile";
  static constexpr absl::string_view kWorkSubdir = "work";

  explicit Sandbox(Policy policy);

  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // Removes the scratch directory if Cleanup() was not called. Backends that
  // own external resources call Cleanup() from their own destructor.
  virtual ~Sandbox();

  // Short backend name, e.g. "bubblewrap".
  virtual absl::string_view name() const = 0;

  // Checks the prerequisites of the backend, creates the instance identifier
  // and scratch directory, and lets the backend prepare its profile.
  // Idempotent. Fails with FAILED_PRECONDITION on an unsupported platform and
  // NOT_FOUND when the tool is missing.
  absl::Status Initialize() ABSL_LOCKS_EXCLUDED(mutex_);

  // Runs one command in the sandbox, initializing it first if needed. Never
  // fails: every problem is reported in the result.
  ExecutionResult Execute(const ExecutionRequest& request)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Best-effort teardown: kills in-flight calls and waits for them to return,
  // then removes the backend's named resources and the scratch directory.
  // Safe to call repeatedly and after a failed Initialize(). Problems are
  // logged; the returned status reports the first one so that callers can
  // decide whether to care.
  absl::Status Cleanup() ABSL_LOCKS_EXCLUDED(mutex_, calls_mutex_);

  // Terminates all in-flight executions, including calls that have not
  // spawned their process yet. Their results report killed = true.
  void Kill() ABSL_LOCKS_EXCLUDED(calls_mutex_);

  // Replaces the sink receiving one AuditRecord per Execute() call. The
  // default sink logs them. Passing nullptr disables auditing.
  void set_audit_sink(std::shared_ptr<AuditSink> sink)
      ABSL_LOCKS_EXCLUDED(audit_mutex_);

  const Policy& policy() const { return policy_; }

  // Instance identifier, empty before Initialize().
  std::string id() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Scratch directory of the instance, empty before Initialize().
  std::string scratch_dir() const ABSL_LOCKS_EXCLUDED(mutex_);

  bool is_initialized() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Locations inside the scratch directory of an instance.
  static std::string ProfileDir(absl::string_view scratch_dir);
  static std::string WorkRoot(absl::string_view scratch_dir);

 protected:
  // Verifies that the backend can run on this host, e.g. the platform and
  // the presence of its tool.
  virtual absl::Status CheckPrerequisites() = 0;

  // Called at the end of Initialize() with the freshly created scratch
  // directory, e.g. to write a profile into ProfileDir(scratch_dir). Runs
  // under the instance lock: must not call id() or scratch_dir().
  virtual absl::Status SetUp(absl::string_view scratch_dir) {
    return absl::OkStatus();
  }

  // Translates the request into the command that runs it. Cleanup() waits for
  // in-flight calls under the instance lock: must not call id() or
  // scratch_dir(), everything needed is in `call`.
  virtual absl::StatusOr<Command> BuildCommand(const ExecutionRequest& request,
                                               const CallContext& call) = 0;

  // Backend-native stop of the call, invoked when the watchdog fires, after
  // the process group was killed. Must not block; see StartHelper().
  virtual void OnTimeout(absl::string_view call_id) {}

  // Removes backend resources, e.g. containers named after call_ids(). Called
  // by Cleanup() before the scratch directory is removed. Runs under the
  // instance lock: must not call id() or scratch_dir().
  virtual absl::Status TearDown() { return absl::OkStatus(); }

  // Returns the working directory of the request: the request's override, the
  // policy's default or `fallback`, in that order.
  std::string ResolveWorkDir(const ExecutionRequest& request,
                             absl::string_view fallback) const;

  // Environment of the launched tool: the minimal host environment with the
  // request's variables merged in.
  EnvMap ToolEnvironment(const ExecutionRequest& request) const;

  // Starts a helper command (e.g. a container stop) without waiting for it.
  // The helper is bounded by --procjail_probe_timeout and reaped by Cleanup().
  void StartHelper(std::vector<std::string> argv)
      ABSL_LOCKS_EXCLUDED(helpers_mutex_);

  // Runs a helper command to completion, bounded by --procjail_probe_timeout.
  ExecutionResult RunHelper(std::vector<std::string> argv) const;

  // Returns all call ids minted so far, in order.
  std::vector<std::string> call_ids() const ABSL_LOCKS_EXCLUDED(calls_mutex_);

 private:
  absl::Status InitializeLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  // Initializes the instance if needed and registers a new call. The call
  // stays in flight until EndCall().
  absl::Status BeginCall(CallContext* call, uint64_t* kill_epoch)
      ABSL_LOCKS_EXCLUDED(mutex_, calls_mutex_);
  void EndCall(const CallContext& call) ABSL_LOCKS_EXCLUDED(calls_mutex_);

  // Runs a registered call.
  ExecutionResult RunCall(const ExecutionRequest& request,
                          const CallContext& call, uint64_t kill_epoch)
      ABSL_LOCKS_EXCLUDED(calls_mutex_);

  void KillLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(calls_mutex_);

  void Audit(const ExecutionRequest& request, absl::string_view call_id,
             absl::Time start, const ExecutionResult& result)
      ABSL_LOCKS_EXCLUDED(audit_mutex_);

  // Waits for helpers started by StartHelper().
  void AwaitHelpers() ABSL_LOCKS_EXCLUDED(helpers_mutex_);

  // Removes the scratch directory and resets the instance state.
  absl::Status RemoveScratch() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const Policy policy_;

  mutable absl::Mutex mutex_;
  bool initialized_ ABSL_GUARDED_BY(mutex_) = false;
  std::string id_ ABSL_GUARDED_BY(mutex_);
  std::string scratch_dir_ ABSL_GUARDED_BY(mutex_);
  uint64_t next_call_ ABSL_GUARDED_BY(mutex_) = 0;

  // Acquired after mutex_ when both are needed.
  mutable absl::Mutex calls_mutex_;
  // Calls between BeginCall() and EndCall().
  int active_calls_ ABSL_GUARDED_BY(calls_mutex_) = 0;
  // Bumped by every Kill(). A call registered under an older epoch is killed
  // as soon as its process exists.
  uint64_t kill_epoch_ ABSL_GUARDED_BY(calls_mutex_) = 0;
  absl::flat_hash_set<Subprocess*> running_ ABSL_GUARDED_BY(calls_mutex_);
  std::vector<std::string> call_ids_ ABSL_GUARDED_BY(calls_mutex_);

  absl::Mutex audit_mutex_;
  std::shared_ptr<AuditSink> audit_sink_ ABSL_GUARDED_BY(audit_mutex_);

  absl::Mutex helpers_mutex_;
  std::vector<std::unique_ptr<Subprocess>> helpers_
      ABSL_GUARDED_BY(helpers_mutex_);
};

}  // namespace procjail

#endif  // PROCJAIL_SANDBOX_H_
