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

#include "procjail/sandbox.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "procjail/audit.h"
#include "procjail/execution.h"
#include "procjail/flags.h"
#include "procjail/policy.h"
#include "procjail/subprocess.h"
#include "procjail/util.h"
#include "procjail/util/fileops.h"
#include "procjail/util/path.h"
#include "procjail/util/status_macros.h"
#include "procjail/util/temp_file.h"

namespace procjail {

namespace {

constexpr int kIdTokenLength = 12;
constexpr size_t kMaxHelperOutput = 64 << 10;

std::string ScratchRoot() {
  std::string root = absl::GetFlag(FLAGS_procjail_scratch_root);
  return root.empty() ? GetSystemTempDir() : root;
}

OutputLimits HelperLimits() {
  OutputLimits limits;
  limits.timeout = absl::GetFlag(FLAGS_procjail_probe_timeout);
  limits.max_output_bytes = kMaxHelperOutput;
  return limits;
}

}  // namespace

Sandbox::Sandbox(Policy policy)
    : policy_(std::move(policy)),
      audit_sink_(std::make_shared<LogAuditSink>()) {}

Sandbox::~Sandbox() {
  AwaitHelpers();
  absl::MutexLock lock(&mutex_);
  if (!scratch_dir_.empty()) {
    LOG(WARNING) << "Sandbox " << id_ << " destroyed without Cleanup()";
    if (absl::Status status = RemoveScratch(); !status.ok()) {
      LOG(WARNING) << status;
    }
  }
}

absl::Status Sandbox::Initialize() {
  absl::MutexLock lock(&mutex_);
  return InitializeLocked();
}

absl::Status Sandbox::InitializeLocked() {
  if (initialized_) {
    return absl::OkStatus();
  }
  if (absl::Status status = CheckPrerequisites(); !status.ok()) {
    LOG(ERROR) << "Cannot initialize " << name() << " sandbox: " << status;
    return status;
  }

  id_ = absl::StrCat("procjail-", name(), "-",
                     util::RandomHexToken(kIdTokenLength));
  absl::StatusOr<std::string> scratch_dir =
      CreateTempDir(file::JoinPath(ScratchRoot(), absl::StrCat(id_, ".")));
  if (!scratch_dir.ok()) {
    LOG(ERROR) << "Cannot create scratch directory for " << id_ << ": "
               << scratch_dir.status();
    id_.clear();
    return scratch_dir.status();
  }
  scratch_dir_ = *std::move(scratch_dir);

  absl::Status status;
  for (const std::string& dir :
       {ProfileDir(scratch_dir_), WorkRoot(scratch_dir_)}) {
    status.Update(file_util::fileops::CreateDirectories(dir, 0700));
  }
  if (status.ok()) {
    status = SetUp(scratch_dir_);
  }
  if (!status.ok()) {
    LOG(ERROR) << "Cannot set up " << name() << " sandbox " << id_ << ": "
               << status;
    if (absl::Status cleanup_status = RemoveScratch(); !cleanup_status.ok()) {
      LOG(WARNING) << cleanup_status;
    }
    return status;
  }
  initialized_ = true;
  LOG(INFO) << "Initialized " << name() << " sandbox " << id_ << " in "
            << scratch_dir_;
  VLOG(1) << id_ << " policy: " << policy_.ToString();
  return absl::OkStatus();
}

ExecutionResult Sandbox::Execute(const ExecutionRequest& request) {
  const absl::Time start = absl::Now();
  CallContext call;
  uint64_t kill_epoch = 0;
  ExecutionResult result;
  if (absl::Status status = BeginCall(&call, &kill_epoch); !status.ok()) {
    result = MakeErrorResult(
        absl::StrCat(name(), " sandbox unavailable: ", status.message()),
        absl::Now() - start);
  } else {
    result = RunCall(request, call, kill_epoch);
    EndCall(call);
  }
  Audit(request, call.id, start, result);
  return result;
}

absl::Status Sandbox::BeginCall(CallContext* call, uint64_t* kill_epoch) {
  absl::MutexLock lock(&mutex_);
  PROCJAIL_RETURN_IF_ERROR(InitializeLocked());
  call->id = absl::StrCat(id_, "-", next_call_++);
  call->scratch_dir = file::JoinPath(WorkRoot(scratch_dir_), call->id);
  call->profile_dir = ProfileDir(scratch_dir_);
  absl::MutexLock calls_lock(&calls_mutex_);
  ++active_calls_;
  *kill_epoch = kill_epoch_;
  call_ids_.push_back(call->id);
  return absl::OkStatus();
}

void Sandbox::EndCall(const CallContext& call) {
  if (absl::Status status =
          file_util::fileops::DeleteRecursively(call.scratch_dir);
      !status.ok()) {
    LOG(WARNING) << call.id << ": " << status;
  }
  absl::MutexLock lock(&calls_mutex_);
  --active_calls_;
}

ExecutionResult Sandbox::RunCall(const ExecutionRequest& request,
                                 const CallContext& call,
                                 uint64_t kill_epoch) {
  const absl::Time start = absl::Now();
  if (absl::Status status =
          file_util::fileops::CreateDirectories(call.scratch_dir, 0700);
      !status.ok()) {
    LOG(WARNING) << call.id << ": " << status;
    return MakeErrorResult(std::string(status.message()), absl::Now() - start);
  }
  absl::StatusOr<Command> command = BuildCommand(request, call);
  if (!command.ok()) {
    LOG(WARNING) << call.id << ": " << command.status();
    return MakeErrorResult(std::string(command.status().message()),
                           absl::Now() - start);
  }
  VLOG(1) << call.id << " argv: " << absl::StrJoin(command->argv, " ");

  OutputLimits limits;
  limits.timeout = policy_.timeout();
  limits.max_output_bytes = policy_.max_output_bytes();
  Subprocess process(*std::move(command), limits);
  process.set_on_timeout([this, call_id = call.id] { OnTimeout(call_id); });
  {
    // Registered before the spawn so that a concurrent Kill() cannot miss it.
    absl::MutexLock lock(&calls_mutex_);
    running_.insert(&process);
    if (kill_epoch_ != kill_epoch) {
      process.Kill();
    }
  }
  process.RunAsync();
  ExecutionResult result = process.AwaitResult();
  {
    absl::MutexLock lock(&calls_mutex_);
    running_.erase(&process);
  }
  return result;
}

absl::Status Sandbox::Cleanup() {
  absl::Status status;
  absl::MutexLock lock(&mutex_);
  {
    // No call can begin while the instance lock is held.
    absl::MutexLock calls_lock(&calls_mutex_);
    KillLocked();
    auto all_returned = [this]() {
      calls_mutex_.AssertReaderHeld();
      return active_calls_ == 0;
    };
    calls_mutex_.Await(absl::Condition(&all_returned));
  }
  if (initialized_) {
    status = TearDown();
    if (!status.ok()) {
      LOG(WARNING) << "Teardown of " << id_ << " failed: " << status;
    }
  }
  AwaitHelpers();
  if (absl::Status scratch_status = RemoveScratch(); !scratch_status.ok()) {
    LOG(WARNING) << scratch_status;
    status.Update(scratch_status);
  }
  absl::MutexLock calls_lock(&calls_mutex_);
  call_ids_.clear();
  return status;
}

void Sandbox::Kill() {
  absl::MutexLock lock(&calls_mutex_);
  KillLocked();
}

void Sandbox::KillLocked() {
  ++kill_epoch_;
  for (Subprocess* process : running_) {
    process->Kill();
  }
}

void Sandbox::set_audit_sink(std::shared_ptr<AuditSink> sink) {
  absl::MutexLock lock(&audit_mutex_);
  audit_sink_ = std::move(sink);
}

void Sandbox::Audit(const ExecutionRequest& request, absl::string_view call_id,
                    absl::Time start, const ExecutionResult& result) {
  std::shared_ptr<AuditSink> sink;
  {
    absl::MutexLock lock(&audit_mutex_);
    sink = audit_sink_;
  }
  if (sink != nullptr) {
    sink->Record(MakeAuditRecord(request, name(), call_id, start, result));
  }
}

std::string Sandbox::id() const {
  absl::MutexLock lock(&mutex_);
  return id_;
}

std::string Sandbox::scratch_dir() const {
  absl::MutexLock lock(&mutex_);
  return scratch_dir_;
}

bool Sandbox::is_initialized() const {
  absl::MutexLock lock(&mutex_);
  return initialized_;
}

std::string Sandbox::ResolveWorkDir(const ExecutionRequest& request,
                                    absl::string_view fallback) const {
  if (request.work_dir.has_value() && !request.work_dir->empty()) {
    return *request.work_dir;
  }
  if (!policy_.work_dir().empty()) {
    return policy_.work_dir();
  }
  return std::string(fallback);
}

EnvMap Sandbox::ToolEnvironment(const ExecutionRequest& request) const {
  return util::MergeEnvironment(util::MinimalEnvironment(), request.env);
}

void Sandbox::StartHelper(std::vector<std::string> argv) {
  Command command;
  command.argv = std::move(argv);
  command.envp = util::ToEnvStrings(util::MinimalEnvironment());
  VLOG(1) << "Starting helper: " << absl::StrJoin(command.argv, " ");
  auto helper = std::make_unique<Subprocess>(std::move(command), HelperLimits());
  helper->RunAsync();
  absl::MutexLock lock(&helpers_mutex_);
  helpers_.push_back(std::move(helper));
}

ExecutionResult Sandbox::RunHelper(std::vector<std::string> argv) const {
  Command command;
  command.argv = std::move(argv);
  command.envp = util::ToEnvStrings(util::MinimalEnvironment());
  VLOG(1) << "Running helper: " << absl::StrJoin(command.argv, " ");
  return RunCommand(std::move(command), HelperLimits());
}

std::vector<std::string> Sandbox::call_ids() const {
  absl::MutexLock lock(&calls_mutex_);
  return call_ids_;
}

std::string Sandbox::ProfileDir(absl::string_view scratch_dir) {
  return file::JoinPath(scratch_dir, kProfileSubdir);
}

std::string Sandbox::WorkRoot(absl::string_view scratch_dir) {
  return file::JoinPath(scratch_dir, kWorkSubdir);
}

void Sandbox::AwaitHelpers() {
  std::vector<std::unique_ptr<Subprocess>> helpers;
  {
    absl::MutexLock lock(&helpers_mutex_);
    helpers.swap(helpers_);
  }
  for (const std::unique_ptr<Subprocess>& helper : helpers) {
    ExecutionResult result = helper->AwaitResult();
    if (!result.success) {
      VLOG(1) << "Helper finished: " << result.ToString();
    }
  }
}

absl::Status Sandbox::RemoveScratch() {
  absl::Status status;
  if (!scratch_dir_.empty()) {
    status = file_util::fileops::DeleteRecursively(scratch_dir_);
    if (status.ok()) {
      VLOG(1) << "Removed scratch directory " << scratch_dir_;
    }
  }
  initialized_ = false;
  scratch_dir_.clear();
  id_.clear();
  return status;
}

}  // namespace procjail
