// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "keel/coordinator/saga_coordinator.h"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>
#include <glog/logging.h>

#include "keel/coordinator/compensator.h"
#include "keel/coordinator/recovery_manager.h"
#include "keel/coordinator/saga_execution.h"
#include "keel/coordinator/step_graph.h"
#include "keel/coordinator/step_invoker.h"
#include "keel/coordinator/timeout_monitor.h"
#include "keel/storage/saga_txn_store.h"
#include "keel/util/monotime.h"
#include "keel/util/threadpool.h"
#include "keel/util/wall_clock.h"

using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

namespace keel {

SagaCoordinator::SagaCoordinator(SagaCoordinatorOptions opts, SagaTxnStore* store)
    : opts_(std::move(opts)),
      store_(store),
      instance_id_(opts_.instance_id),
      initted_(false),
      shutting_down_(false) {
  if (instance_id_.empty()) {
    instance_id_ = oid_generator_.Next();
  }
}

SagaCoordinator::~SagaCoordinator() {
  Shutdown();
}

Status SagaCoordinator::Init() {
  CHECK(!initted_.load()) << "saga coordinator already initialized";
  RETURN_NOT_OK(ThreadPoolBuilder("saga-driver")
                .set_max_threads(opts_.driver_pool_max_threads)
                .Build(&driver_pool_));
  RETURN_NOT_OK(ThreadPoolBuilder("saga-step")
                .set_max_threads(opts_.step_pool_max_threads)
                .Build(&step_pool_));
  RETURN_NOT_OK(ThreadPoolBuilder("saga-call")
                .set_max_threads(opts_.call_pool_max_threads)
                .Build(&call_pool_));
  invoker_.reset(new StepInvoker(call_pool_.get(), opts_.retry_backoff_base));
  compensator_.reset(new Compensator(this));
  initted_ = true;

  if (opts_.enable_background_tasks) {
    recovery_manager_.reset(new RecoveryManager(this, opts_.recovery_interval,
                                                opts_.background_error_backoff));
    RETURN_NOT_OK_PREPEND(recovery_manager_->Init(), "unable to start saga recovery");
    timeout_monitor_.reset(new TimeoutMonitor(this, opts_.timeout_check_interval,
                                              opts_.background_error_backoff));
    RETURN_NOT_OK_PREPEND(timeout_monitor_->Init(), "unable to start saga timeout monitor");
  }
  LOG(INFO) << "Saga coordinator " << instance_id_ << " started";
  return Status::OK();
}

void SagaCoordinator::Shutdown() {
  if (!initted_.load() || shutting_down_.exchange(true)) {
    return;
  }
  LOG(INFO) << "Shutting down saga coordinator " << instance_id_;

  if (recovery_manager_) {
    recovery_manager_->Shutdown();
  }
  if (timeout_monitor_) {
    timeout_monitor_->Shutdown();
  }

  // Wake up the drivers, steps in backoff and callers blocked on a service.
  invoker_->Shutdown();
  for (const auto& exec : ActiveExecutions()) {
    exec->Notify();
  }

  driver_pool_->Shutdown();
  step_pool_->Shutdown();
  // Threads stuck in a service client are joined here: the clients are
  // expected to honor the deadline of their calls.
  call_pool_->Shutdown();

  std::lock_guard<std::mutex> l(lock_);
  if (!executions_.empty()) {
    LOG(INFO) << "Saga coordinator " << instance_id_ << " left " << executions_.size()
              << " saga(s) in progress for recovery";
  }
  executions_.clear();
}

Status SagaCoordinator::CheckRunning() const {
  if (!initted_.load()) {
    return Status::IllegalState("saga coordinator is not initialized");
  }
  if (shutting_down()) {
    return Status::ServiceUnavailable("saga coordinator is shutting down");
  }
  return Status::OK();
}

Status SagaCoordinator::RegisterServiceClient(const string& service_name,
                                              shared_ptr<ServiceClient> client) {
  RETURN_NOT_OK(registry_.Register(service_name, std::move(client)));
  VLOG(1) << "Registered service client for '" << service_name << "'";
  return Status::OK();
}

Status SagaCoordinator::StartSaga(const string& saga_id,
                                  const vector<SagaStep>& steps,
                                  string* txn_id) {
  return StartSaga(saga_id, steps, opts_.default_saga_timeout_s, txn_id);
}

Status SagaCoordinator::StartSaga(const string& saga_id,
                                  const vector<SagaStep>& steps,
                                  int32_t saga_timeout_s,
                                  string* txn_id) {
  RETURN_NOT_OK(CheckRunning());
  const string id = saga_id.empty() ? oid_generator_.Next() : saga_id;
  RETURN_NOT_OK(StepGraph::ValidateTransactionId(id));
  RETURN_NOT_OK(StepGraph::Validate(steps, registry_));
  if (saga_timeout_s <= 0) {
    return Status::InvalidArgument(
        absl::Substitute("non-positive saga timeout: $0s", saga_timeout_s));
  }

  int64_t now_us = GetCurrentTimeMicros();
  int64_t timeout_at_us = now_us + MonoDelta::FromSeconds(saga_timeout_s).ToMicroseconds();
  shared_ptr<SagaExecution> exec(new SagaExecution(id, steps, now_us, timeout_at_us));
  const string prefix = LogPrefix(id);

  // Registering first keeps concurrent starts with the same id apart.
  RETURN_NOT_OK(RegisterExecution(exec));
  SagaTxnRecordPB existing;
  Status s = store_->Get(id, &existing);
  if (s.ok()) {
    s = Status::AlreadyPresent("saga transaction already exists", id);
  } else if (s.IsNotFound()) {
    s = Checkpoint(exec.get());
  }
  if (s.ok()) {
    CHECK(exec->TransitionStatus(SagaStatus::kPending, SagaStatus::kRunning));
    s = Checkpoint(exec.get());
    // A failure here leaves a Pending record which the timeout monitor
    // eventually fails.
  }
  if (s.ok()) {
    s = SubmitDriver(exec);
  }
  if (!s.ok()) {
    UnregisterExecution(id);
    return s;
  }

  LOG(INFO) << prefix << "started saga with " << steps.size() << " step(s), timeout "
            << saga_timeout_s << "s";
  *txn_id = id;
  return Status::OK();
}

Status SagaCoordinator::GetTransactionStatus(const string& txn_id,
                                             SagaTxnRecordPB* record) {
  return store_->Get(txn_id, record);
}

Status SagaCoordinator::CancelTransaction(const string& txn_id, bool* cancelled) {
  *cancelled = false;
  RETURN_NOT_OK(CheckRunning());
  const string prefix = LogPrefix(txn_id);
  shared_ptr<SagaExecution> exec = FindExecution(txn_id);
  if (!exec) {
    SagaTxnRecordPB record;
    RETURN_NOT_OK(store_->Get(txn_id, &record));
    LOG(INFO) << prefix << "not cancelling saga in status "
              << SagaStatusPB_Name(record.status()) << ": not driven by this coordinator";
    return Status::OK();
  }
  if (!exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kCompensating)) {
    LOG(INFO) << prefix << "not cancelling saga in status " << exec->status();
    return Status::OK();
  }
  Status s = Checkpoint(exec.get());
  if (!s.ok()) {
    exec->TransitionStatus(SagaStatus::kCompensating, SagaStatus::kRunning);
    return s.CloneAndPrepend("unable to cancel saga");
  }
  exec->RequestAbort("saga cancelled");
  LOG(INFO) << prefix << "saga cancelled";
  *cancelled = true;
  return Status::OK();
}

Status SagaCoordinator::RecoverOrphanedTransactions(int* num_recovered) {
  RETURN_NOT_OK(CheckRunning());
  int recovered = 0;

  // Renew the leases of the sagas driven here, so that no other coordinator
  // adopts them.
  SagaTxnFilter filter;
  for (const auto& exec : ActiveExecutions()) {
    WARN_NOT_OK(Checkpoint(exec.get()),
                LogPrefix(exec->txn_id()) + "unable to renew lease");
    filter.exclude_ids.insert(exec->txn_id());
  }

  filter.statuses = { SagaStatus::kRunning, SagaStatus::kCompensating, SagaStatus::kFailed };
  filter.claimable_by = instance_id_;
  filter.claimable_at_us = GetCurrentTimeMicros();
  filter.limit = opts_.background_scan_limit;
  vector<SagaTxnRecordPB> records;
  RETURN_NOT_OK_PREPEND(store_->List(filter, &records),
                        "unable to list saga transactions to recover");

  for (const auto& record : records) {
    if (shutting_down()) {
      break;
    }
    const string& id = record.transaction_id();
    if (IsActive(id)) {
      continue;
    }
    const string prefix = LogPrefix(id);
    SagaTxnRecordPB leased;
    Status s = store_->TryAcquireLease(id, instance_id_, GetCurrentTimeMicros(),
                                       LeaseExpiry(), &leased);
    if (s.IsIllegalState() || s.IsNotFound()) {
      VLOG(1) << prefix << "not recovering: " << s.ToString();
      continue;
    }
    RETURN_NOT_OK_PREPEND(s, prefix + "unable to acquire lease");

    unique_ptr<SagaExecution> exec_ptr;
    s = SagaExecution::FromRecord(leased, &exec_ptr);
    if (!s.ok()) {
      LOG(ERROR) << prefix << "unable to recover saga, skipping it: " << s.ToString();
      continue;
    }
    shared_ptr<SagaExecution> exec(std::move(exec_ptr));
    SagaStatus status = exec->status();
    if (status != SagaStatus::kRunning && status != SagaStatus::kCompensating &&
        status != SagaStatus::kFailed) {
      // Finished after it was listed.
      continue;
    }
    exec->PrepareForRecovery();
    if (!RegisterExecution(exec).ok()) {
      continue;
    }
    s = Checkpoint(exec.get());
    if (s.ok()) {
      s = SubmitDriver(exec);
    }
    if (!s.ok()) {
      UnregisterExecution(id);
      return s.CloneAndPrepend(prefix + "unable to recover saga");
    }
    LOG(INFO) << prefix << "recovered saga in status " << status << " (recovery #"
              << exec->recovery_count() << ", previous owner "
              << (record.has_owner_id() ? record.owner_id() : "<none>") << ")";
    recovered++;
  }

  if (num_recovered) {
    *num_recovered = recovered;
  }
  return Status::OK();
}

Status SagaCoordinator::AbortTimedOutTransactions(int* num_aborted) {
  RETURN_NOT_OK(CheckRunning());
  int aborted = 0;
  int64_t now_us = GetCurrentTimeMicros();
  Status persist_status;

  SagaTxnFilter filter;
  filter.statuses = { SagaStatus::kPending, SagaStatus::kRunning };
  filter.timeout_before_us = now_us;
  // Sagas driven here hold a lease of this instance, so they are still listed.
  filter.claimable_by = instance_id_;
  filter.claimable_at_us = now_us;
  filter.limit = opts_.background_scan_limit;
  vector<SagaTxnRecordPB> records;
  RETURN_NOT_OK_PREPEND(store_->List(filter, &records),
                        "unable to list timed out saga transactions");

  for (const auto& record : records) {
    if (shutting_down()) {
      break;
    }
    const string& id = record.transaction_id();
    const string prefix = LogPrefix(id);
    shared_ptr<SagaExecution> exec = FindExecution(id);
    if (exec) {
      // A Pending saga in memory is being started; the next pass sees it.
      if (exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kFailed)) {
        LOG(WARNING) << prefix << "saga timed out at "
                     << TimestampToString(exec->timeout_at_us()) << ", compensating";
        // Compensation goes ahead in memory; the failure is still reported.
        Status s = Checkpoint(exec.get());
        if (!s.ok() && persist_status.ok()) {
          persist_status = s.CloneAndPrepend(prefix + "unable to persist saga timeout");
        }
        exec->RequestAbort("saga timed out");
        aborted++;
      }
      continue;
    }
    Status s = AbortOrphanedTransaction(record, now_us);
    if (s.IsIllegalState() || s.IsNotFound()) {
      VLOG(1) << prefix << "not aborting: " << s.ToString();
      continue;
    }
    if (s.IsCorruption()) {
      LOG(ERROR) << prefix << "unable to abort saga, skipping it: " << s.ToString();
      continue;
    }
    RETURN_NOT_OK(s);
    aborted++;
  }

  if (num_aborted) {
    *num_aborted = aborted;
  }
  return persist_status;
}

Status SagaCoordinator::AbortOrphanedTransaction(const SagaTxnRecordPB& record,
                                                 int64_t now_us) {
  const string& id = record.transaction_id();
  SagaTxnRecordPB leased;
  RETURN_NOT_OK(store_->TryAcquireLease(id, instance_id_, now_us, LeaseExpiry(), &leased));
  unique_ptr<SagaExecution> exec_ptr;
  RETURN_NOT_OK(SagaExecution::FromRecord(leased, &exec_ptr));
  shared_ptr<SagaExecution> exec(std::move(exec_ptr));
  if (exec->status() != SagaStatus::kPending && exec->status() != SagaStatus::kRunning) {
    return Status::IllegalState("saga is no longer pending or running",
                                SagaStatusToString(exec->status()));
  }

  // Steps the previous owner left running never report back.
  exec->PrepareForRecovery();
  exec->set_status(SagaStatus::kFailed);
  RETURN_NOT_OK(RegisterExecution(exec));
  Status s = Checkpoint(exec.get());
  if (s.ok()) {
    s = SubmitDriver(exec);
  }
  if (!s.ok()) {
    UnregisterExecution(id);
    return s;
  }
  LOG(WARNING) << LogPrefix(id) << "orphaned saga timed out at "
               << TimestampToString(exec->timeout_at_us()) << ", compensating";
  return Status::OK();
}

int SagaCoordinator::num_active_transactions() const {
  std::lock_guard<std::mutex> l(lock_);
  return static_cast<int>(executions_.size());
}

bool SagaCoordinator::IsActive(const string& txn_id) const {
  std::lock_guard<std::mutex> l(lock_);
  return executions_.count(txn_id) > 0;
}

Status SagaCoordinator::Checkpoint(SagaExecution* exec) {
  return exec->Checkpoint(store_, instance_id_, LeaseExpiry());
}

Status SagaCoordinator::RegisterExecution(const shared_ptr<SagaExecution>& exec) {
  std::lock_guard<std::mutex> l(lock_);
  if (!executions_.emplace(exec->txn_id(), exec).second) {
    return Status::AlreadyPresent("saga transaction is already in progress", exec->txn_id());
  }
  return Status::OK();
}

void SagaCoordinator::UnregisterExecution(const string& txn_id) {
  std::lock_guard<std::mutex> l(lock_);
  executions_.erase(txn_id);
}

shared_ptr<SagaExecution> SagaCoordinator::FindExecution(const string& txn_id) const {
  std::lock_guard<std::mutex> l(lock_);
  auto it = executions_.find(txn_id);
  return it == executions_.end() ? nullptr : it->second;
}

vector<shared_ptr<SagaExecution>> SagaCoordinator::ActiveExecutions() const {
  vector<shared_ptr<SagaExecution>> ret;
  std::lock_guard<std::mutex> l(lock_);
  ret.reserve(executions_.size());
  for (const auto& e : executions_) {
    ret.push_back(e.second);
  }
  return ret;
}

Status SagaCoordinator::SubmitDriver(const shared_ptr<SagaExecution>& exec) {
  if (exec->status() == SagaStatus::kRunning) {
    return driver_pool_->SubmitFunc([this, exec]() { this->DriveSaga(exec); });
  }
  return driver_pool_->SubmitFunc([this, exec]() { this->DriveCompensation(exec); });
}

void SagaCoordinator::DriveSaga(const shared_ptr<SagaExecution>& exec) {
  const string prefix = LogPrefix(exec->txn_id());
  Status s = RunSchedulingLoop(exec);
  if (shutting_down()) {
    LOG(INFO) << prefix << "leaving saga " << exec->status() << " on shutdown";
    return;
  }
  if (s.ok()) {
    if (exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kCompleted)) {
      Status cs = Checkpoint(exec.get());
      if (cs.ok()) {
        LOG(INFO) << prefix << "saga completed";
      } else {
        // The record stays Running with every step completed: the next
        // recovery pass completes it.
        LOG(ERROR) << prefix << "unable to persist saga completion: " << cs.ToString();
      }
      UnregisterExecution(exec->txn_id());
      return;
    }
    // Cancelled or timed out after the last step completed.
    s = Status::Aborted(exec->abort_reason());
  }

  LOG(WARNING) << prefix << "saga failed: " << s.ToString();
  if (exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kFailed)) {
    WARN_NOT_OK(Checkpoint(exec.get()), prefix + "unable to persist saga failure");
  }
  DriveCompensation(exec);
}

void SagaCoordinator::DriveCompensation(const shared_ptr<SagaExecution>& exec) {
  Status s = compensator_->Run(exec);
  if (!s.ok()) {
    if (shutting_down()) {
      LOG(INFO) << LogPrefix(exec->txn_id()) << "compensation interrupted by shutdown";
      return;
    }
    // The saga stays Compensating (or Failed) in the store. It is no longer
    // active here, so the next recovery pass of this coordinator reclaims its
    // own lease and resumes it.
    LOG(ERROR) << LogPrefix(exec->txn_id()) << "compensation interrupted: " << s.ToString();
  }
  UnregisterExecution(exec->txn_id());
}

Status SagaCoordinator::RunSchedulingLoop(const shared_ptr<SagaExecution>& exec) {
  const string prefix = LogPrefix(exec->txn_id());
  while (true) {
    uint64_t since = exec->change_count();
    if (shutting_down()) {
      return Status::ServiceUnavailable("saga coordinator is shutting down");
    }
    if (exec->abort_requested()) {
      return Status::Aborted(exec->abort_reason());
    }
    switch (exec->GetProgress()) {
      case SagaExecution::Progress::kAllCompleted:
        return Status::OK();
      case SagaExecution::Progress::kStepFailed: {
        const string failed = exec->failed_steps().front();
        return Status::RuntimeError(absl::Substitute("step $0 failed", failed),
                                    exec->GetStepExecution(failed).error);
      }
      case SagaExecution::Progress::kInProgress:
        break;
    }

    vector<string> ready = exec->TakeReadySteps(GetCurrentTimeMicros());
    if (!ready.empty()) {
      VLOG(1) << prefix << "dispatching step(s) " << absl::StrJoin(ready, ", ");
      Status s = Checkpoint(exec.get());
      if (!s.ok()) {
        for (const auto& id : ready) {
          exec->MarkStepFailed(id, "not dispatched: " + s.ToString(), 0,
                               GetCurrentTimeMicros());
        }
        return s;
      }
      for (const auto& id : ready) {
        s = step_pool_->SubmitFunc([this, exec, id]() { this->ExecuteStep(exec, id); });
        if (!s.ok()) {
          if (shutting_down()) {
            return s;
          }
          exec->MarkStepFailed(id, "not dispatched: " + s.ToString(), 0,
                               GetCurrentTimeMicros());
        }
      }
      continue;
    }

    if (!exec->HasUnfinishedSteps()) {
      return Status::IllegalState("no step of the saga can make progress");
    }
    exec->WaitForChange(since, opts_.scheduler_poll_interval);
  }
}

void SagaCoordinator::ExecuteStep(const shared_ptr<SagaExecution>& exec,
                                  const string& step_id) {
  const string prefix = LogPrefix(exec->txn_id());
  const SagaStep* step = exec->FindStep(step_id);
  CHECK(step) << prefix << "unknown step " << step_id;
  if (exec->ReleaseStepIfHalted(step_id)) {
    // Queued behind other steps while the saga was cancelled, timed out or
    // lost a step: the action is not called.
    VLOG(1) << prefix << "not executing step " << step_id << ": saga halted";
    Status cs = Checkpoint(exec.get());
    if (!cs.ok()) {
      LOG(ERROR) << prefix << "unable to checkpoint released step " << step_id << ": "
                 << cs.ToString();
    }
    return;
  }
  VLOG(1) << prefix << "executing " << step->ToString();

  Payload result;
  int32_t failed_attempts = 0;
  Status s;
  shared_ptr<ServiceClient> client = registry_.Lookup(step->service_name);
  if (!client) {
    s = Status::NotFound("no service client registered for service", step->service_name);
    failed_attempts = 1;
  } else {
    SagaExecution* raw = exec.get();
    s = invoker_->InvokeWithRetries(
        prefix, *step, client,
        [this, raw](const MonoDelta& delay) { return this->WaitBeforeRetry(raw, delay); },
        &result, &failed_attempts);
  }

  if (s.ok()) {
    exec->MarkStepCompleted(step_id, std::move(result), failed_attempts,
                            GetCurrentTimeMicros());
    VLOG(1) << prefix << "step " << step_id << " completed";
  } else {
    if (shutting_down()) {
      // Re-run by whoever recovers the saga.
      LOG(INFO) << prefix << "leaving step " << step_id << " running on shutdown";
      return;
    }
    exec->MarkStepFailed(step_id, s.ToString(), failed_attempts, GetCurrentTimeMicros());
    VLOG(1) << prefix << "step " << step_id << " failed: " << s.ToString();
  }

  Status cs = Checkpoint(exec.get());
  if (!cs.ok()) {
    LOG(ERROR) << prefix << "aborting saga: " << cs.ToString();
    exec->RequestAbort("unable to checkpoint saga: " + cs.ToString());
  }
}

bool SagaCoordinator::WaitBeforeRetry(SagaExecution* exec, const MonoDelta& delay) {
  const MonoTime deadline = MonoTime::Now() + delay;
  while (true) {
    uint64_t since = exec->change_count();
    if (shutting_down() || exec->abort_requested()) {
      return false;
    }
    MonoTime now = MonoTime::Now();
    if (now >= deadline) {
      return true;
    }
    exec->WaitForChange(since, deadline - now);
  }
}

int64_t SagaCoordinator::LeaseExpiry() const {
  return GetCurrentTimeMicros() + opts_.lease_duration.ToMicroseconds();
}

string SagaCoordinator::LogPrefix(const string& txn_id) const {
  return absl::Substitute("T $0 P $1: ", txn_id, instance_id_);
}

} // namespace keel
