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

#include "keel/coordinator/saga_execution.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/substitute.h>
#include <glog/logging.h>

#include "keel/storage/saga_txn_store.h"
#include "keel/util/wall_clock.h"

using std::map;
using std::string;
using std::unique_ptr;
using std::vector;

namespace keel {

namespace {

map<string, StepExecution> InitialStepStates(const vector<SagaStep>& steps) {
  map<string, StepExecution> states;
  for (const auto& step : steps) {
    StepExecution& state = states[step.step_id];
    state.step_id = step.step_id;
  }
  return states;
}

} // anonymous namespace

SagaExecution::SagaExecution(string txn_id,
                             vector<SagaStep> steps,
                             int64_t created_at_us,
                             int64_t timeout_at_us)
    : SagaExecution(std::move(txn_id), steps, InitialStepStates(steps),
                    created_at_us, timeout_at_us) {
}

SagaExecution::SagaExecution(string txn_id,
                             vector<SagaStep> steps,
                             map<string, StepExecution> step_states,
                             int64_t created_at_us,
                             int64_t timeout_at_us)
    : txn_id_(std::move(txn_id)),
      steps_(std::move(steps)),
      created_at_us_(created_at_us),
      timeout_at_us_(timeout_at_us),
      status_(SagaStatus::kPending),
      step_states_(std::move(step_states)),
      recovery_count_(0),
      compensation_failures_(0),
      abort_requested_(false),
      change_count_(0) {
}

Status SagaExecution::FromRecord(const SagaTxnRecordPB& record,
                                 unique_ptr<SagaExecution>* execution) {
  const string& txn_id = record.transaction_id();
  const string prefix = absl::Substitute("invalid record of transaction $0", txn_id);

  SagaStatus status;
  RETURN_NOT_OK_PREPEND(SagaStatusFromPB(record.status(), &status), prefix);
  vector<SagaStep> steps;
  RETURN_NOT_OK_PREPEND(SagaDefinitionFromPB(record.definition(), &steps), prefix);

  const SagaExecutionLogPB& log = record.execution_log();
  if (log.has_transaction_id() && log.transaction_id() != txn_id) {
    return Status::Corruption(prefix, absl::Substitute(
        "execution log belongs to transaction $0", log.transaction_id()));
  }

  map<string, StepExecution> states;
  for (const auto& step_pb : log.steps()) {
    auto it = std::find_if(steps.begin(), steps.end(), [&](const SagaStep& s) {
      return s.step_id == step_pb.step_id();
    });
    if (it == steps.end()) {
      return Status::Corruption(prefix, absl::Substitute(
          "execution log has unknown step $0", step_pb.step_id()));
    }
    StepExecution state;
    state.step_id = step_pb.step_id();
    RETURN_NOT_OK_PREPEND(StepStatusFromPB(step_pb.status(), &state.status),
                          absl::Substitute("$0: step $1", prefix, step_pb.step_id()));
    state.start_time_us = step_pb.start_time_us();
    state.end_time_us = step_pb.end_time_us();
    state.result.insert(step_pb.result().begin(), step_pb.result().end());
    state.error = step_pb.error();
    state.compensation_error = step_pb.compensation_error();
    state.retries_used = step_pb.retries_used();
    if (!states.emplace(state.step_id, std::move(state)).second) {
      return Status::Corruption(prefix, absl::Substitute(
          "execution log has step $0 twice", step_pb.step_id()));
    }
  }
  for (const auto& step : steps) {
    if (states.count(step.step_id) == 0) {
      return Status::Corruption(prefix, absl::Substitute(
          "execution log has no state for step $0", step.step_id));
    }
  }
  for (const auto& id : log.completed_steps()) {
    if (states.count(id) == 0) {
      return Status::Corruption(prefix, "unknown completed step " + id);
    }
  }
  for (const auto& id : log.failed_steps()) {
    if (states.count(id) == 0) {
      return Status::Corruption(prefix, "unknown failed step " + id);
    }
  }

  unique_ptr<SagaExecution> ret(new SagaExecution(
      txn_id, std::move(steps), std::move(states),
      record.created_at_us(), record.timeout_at_us()));
  ret->status_ = status;
  ret->completed_steps_.assign(log.completed_steps().begin(), log.completed_steps().end());
  ret->failed_steps_.assign(log.failed_steps().begin(), log.failed_steps().end());
  ret->recovery_count_ = record.recovery_count();
  ret->compensation_failures_ = record.compensation_failures();
  *execution = std::move(ret);
  return Status::OK();
}

const SagaStep* SagaExecution::FindStep(const string& step_id) const {
  for (const auto& step : steps_) {
    if (step.step_id == step_id) {
      return &step;
    }
  }
  return nullptr;
}

void SagaExecution::ToRecordPB(SagaTxnRecordPB* record) const {
  record->Clear();
  record->set_transaction_id(txn_id_);
  SagaDefinitionToPB(steps_, record->mutable_definition());
  record->set_created_at_us(created_at_us_);
  record->set_timeout_at_us(timeout_at_us_);

  std::lock_guard<std::mutex> l(lock_);
  record->set_status(SagaStatusToPB(status_));
  ExecutionLogToPBUnlocked(record->mutable_execution_log());
  record->set_recovery_count(recovery_count_);
  record->set_compensation_failures(compensation_failures_);
}

void SagaExecution::ExecutionLogToPBUnlocked(SagaExecutionLogPB* log) const {
  log->Clear();
  log->set_transaction_id(txn_id_);
  log->set_status(SagaStatusToPB(status_));
  // Steps are written in definition order.
  for (const auto& step : steps_) {
    const StepExecution* state = FindStepStateUnlocked(step.step_id);
    DCHECK(state);
    StepExecutionPB* pb = log->add_steps();
    pb->set_step_id(state->step_id);
    pb->set_status(StepStatusToPB(state->status));
    if (state->start_time_us > 0) {
      pb->set_start_time_us(state->start_time_us);
    }
    if (state->end_time_us > 0) {
      pb->set_end_time_us(state->end_time_us);
    }
    for (const auto& e : state->result) {
      (*pb->mutable_result())[e.first] = e.second;
    }
    if (!state->error.empty()) {
      pb->set_error(state->error);
    }
    if (!state->compensation_error.empty()) {
      pb->set_compensation_error(state->compensation_error);
    }
    pb->set_retries_used(state->retries_used);
  }
  for (const auto& id : completed_steps_) {
    log->add_completed_steps(id);
  }
  for (const auto& id : failed_steps_) {
    log->add_failed_steps(id);
  }
}

Status SagaExecution::Checkpoint(SagaTxnStore* store,
                                 const string& owner_id,
                                 int64_t lease_expires_at_us) {
  std::lock_guard<std::mutex> l(checkpoint_lock_);
  SagaTxnRecordPB record;
  ToRecordPB(&record);
  record.set_updated_at_us(GetCurrentTimeMicros());
  record.set_owner_id(owner_id);
  record.set_lease_expires_at_us(lease_expires_at_us);
  RETURN_NOT_OK_PREPEND(store->Upsert(record),
                        absl::Substitute("T $0: unable to checkpoint transaction in status $1",
                                         txn_id_, SagaStatusPB_Name(record.status())));
  VLOG(2) << "T " << txn_id_ << ": checkpointed in status "
          << SagaStatusPB_Name(record.status());
  return Status::OK();
}

SagaStatus SagaExecution::status() const {
  std::lock_guard<std::mutex> l(lock_);
  return status_;
}

void SagaExecution::set_status(SagaStatus status) {
  std::lock_guard<std::mutex> l(lock_);
  VLOG(1) << "T " << txn_id_ << ": " << status_ << " -> " << status;
  status_ = status;
  NotifyUnlocked();
}

bool SagaExecution::TransitionStatus(SagaStatus from, SagaStatus to) {
  std::lock_guard<std::mutex> l(lock_);
  if (status_ != from) {
    return false;
  }
  VLOG(1) << "T " << txn_id_ << ": " << status_ << " -> " << to;
  status_ = to;
  NotifyUnlocked();
  return true;
}

vector<string> SagaExecution::TakeReadySteps(int64_t now_us) {
  vector<string> ready;
  std::lock_guard<std::mutex> l(lock_);
  if (IsHaltedUnlocked()) {
    return ready;
  }
  for (const auto& step : steps_) {
    StepExecution* state = FindStepStateUnlocked(step.step_id);
    if (state->status != StepStatus::kPending) {
      continue;
    }
    bool deps_completed = std::all_of(
        step.depends_on.begin(), step.depends_on.end(), [&](const string& dep) {
          const StepExecution* dep_state = FindStepStateUnlocked(dep);
          return dep_state != nullptr && dep_state->status == StepStatus::kCompleted;
        });
    if (deps_completed) {
      ready.push_back(step.step_id);
    }
  }
  // Mark them only once the whole ready set is known, so that it is computed
  // against a single snapshot of the dependencies.
  for (const auto& id : ready) {
    StepExecution* state = FindStepStateUnlocked(id);
    state->status = StepStatus::kRunning;
    state->start_time_us = now_us;
    state->end_time_us = 0;
  }
  if (!ready.empty()) {
    NotifyUnlocked();
  }
  return ready;
}

bool SagaExecution::ReleaseStepIfHalted(const string& step_id) {
  std::lock_guard<std::mutex> l(lock_);
  StepExecution* state = FindStepStateUnlocked(step_id);
  CHECK(state) << "T " << txn_id_ << ": unknown step " << step_id;
  if (!IsHaltedUnlocked() || state->status != StepStatus::kRunning) {
    return false;
  }
  state->status = StepStatus::kPending;
  state->start_time_us = 0;
  NotifyUnlocked();
  return true;
}

bool SagaExecution::IsHaltedUnlocked() const {
  return abort_requested_ || status_ != SagaStatus::kRunning || !failed_steps_.empty();
}

SagaExecution::Progress SagaExecution::GetProgress() const {
  std::lock_guard<std::mutex> l(lock_);
  bool all_completed = true;
  for (const auto& e : step_states_) {
    if (e.second.status == StepStatus::kFailed) {
      return Progress::kStepFailed;
    }
    if (e.second.status != StepStatus::kCompleted) {
      all_completed = false;
    }
  }
  return all_completed ? Progress::kAllCompleted : Progress::kInProgress;
}

bool SagaExecution::HasUnfinishedSteps() const {
  std::lock_guard<std::mutex> l(lock_);
  for (const auto& e : step_states_) {
    if (e.second.status == StepStatus::kPending ||
        e.second.status == StepStatus::kRunning) {
      return true;
    }
  }
  return false;
}

bool SagaExecution::HasRunningSteps() const {
  std::lock_guard<std::mutex> l(lock_);
  for (const auto& e : step_states_) {
    if (e.second.status == StepStatus::kRunning) {
      return true;
    }
  }
  return false;
}

void SagaExecution::MarkStepCompleted(const string& step_id, Payload result,
                                      int32_t retries_used, int64_t now_us) {
  std::lock_guard<std::mutex> l(lock_);
  StepExecution* state = FindStepStateUnlocked(step_id);
  CHECK(state) << "T " << txn_id_ << ": unknown step " << step_id;
  DCHECK(state->status == StepStatus::kRunning) << state->status;
  state->status = StepStatus::kCompleted;
  state->result = std::move(result);
  state->retries_used = retries_used;
  state->end_time_us = now_us;
  completed_steps_.push_back(step_id);
  NotifyUnlocked();
}

void SagaExecution::MarkStepFailed(const string& step_id, const string& error,
                                   int32_t retries_used, int64_t now_us) {
  std::lock_guard<std::mutex> l(lock_);
  StepExecution* state = FindStepStateUnlocked(step_id);
  CHECK(state) << "T " << txn_id_ << ": unknown step " << step_id;
  state->status = StepStatus::kFailed;
  state->error = error;
  state->retries_used = retries_used;
  state->end_time_us = now_us;
  failed_steps_.push_back(step_id);
  NotifyUnlocked();
}

void SagaExecution::MarkStepCompensating(const string& step_id) {
  std::lock_guard<std::mutex> l(lock_);
  StepExecution* state = FindStepStateUnlocked(step_id);
  CHECK(state) << "T " << txn_id_ << ": unknown step " << step_id;
  DCHECK(state->status == StepStatus::kCompleted ||
         state->status == StepStatus::kCompensating) << state->status;
  state->status = StepStatus::kCompensating;
  NotifyUnlocked();
}

void SagaExecution::MarkStepCompensated(const string& step_id,
                                        const Status& compensation_status) {
  std::lock_guard<std::mutex> l(lock_);
  StepExecution* state = FindStepStateUnlocked(step_id);
  CHECK(state) << "T " << txn_id_ << ": unknown step " << step_id;
  state->status = StepStatus::kCompensated;
  if (!compensation_status.ok()) {
    state->compensation_error = compensation_status.ToString();
    compensation_failures_++;
  }
  NotifyUnlocked();
}

StepExecution SagaExecution::GetStepExecution(const string& step_id) const {
  std::lock_guard<std::mutex> l(lock_);
  const StepExecution* state = FindStepStateUnlocked(step_id);
  CHECK(state) << "T " << txn_id_ << ": unknown step " << step_id;
  return *state;
}

vector<string> SagaExecution::completed_steps() const {
  std::lock_guard<std::mutex> l(lock_);
  return completed_steps_;
}

vector<string> SagaExecution::failed_steps() const {
  std::lock_guard<std::mutex> l(lock_);
  return failed_steps_;
}

int32_t SagaExecution::recovery_count() const {
  std::lock_guard<std::mutex> l(lock_);
  return recovery_count_;
}

int32_t SagaExecution::compensation_failures() const {
  std::lock_guard<std::mutex> l(lock_);
  return compensation_failures_;
}

void SagaExecution::PrepareForRecovery() {
  std::lock_guard<std::mutex> l(lock_);
  for (auto& e : step_states_) {
    StepExecution& state = e.second;
    if (state.status == StepStatus::kRunning) {
      LOG(INFO) << "T " << txn_id_ << ": step " << state.step_id
                << " was running when its coordinator stopped, it will be run again";
      state.status = StepStatus::kPending;
      state.start_time_us = 0;
    }
  }
  recovery_count_++;
  NotifyUnlocked();
}

void SagaExecution::RequestAbort(const string& reason) {
  std::lock_guard<std::mutex> l(lock_);
  if (!abort_requested_) {
    abort_requested_ = true;
    abort_reason_ = reason;
  }
  NotifyUnlocked();
}

bool SagaExecution::abort_requested() const {
  std::lock_guard<std::mutex> l(lock_);
  return abort_requested_;
}

string SagaExecution::abort_reason() const {
  std::lock_guard<std::mutex> l(lock_);
  return abort_reason_;
}

uint64_t SagaExecution::change_count() const {
  std::lock_guard<std::mutex> l(lock_);
  return change_count_;
}

bool SagaExecution::WaitForChange(uint64_t since, const MonoDelta& timeout) const {
  std::unique_lock<std::mutex> l(lock_);
  return cond_.wait_for(l, std::chrono::nanoseconds(std::max<int64_t>(0, timeout.ToNanoseconds())),
                        [&] { return change_count_ != since; });
}

void SagaExecution::Notify() {
  std::lock_guard<std::mutex> l(lock_);
  NotifyUnlocked();
}

void SagaExecution::NotifyUnlocked() {
  change_count_++;
  cond_.notify_all();
}

StepExecution* SagaExecution::FindStepStateUnlocked(const string& step_id) {
  auto it = step_states_.find(step_id);
  return it == step_states_.end() ? nullptr : &it->second;
}

const StepExecution* SagaExecution::FindStepStateUnlocked(const string& step_id) const {
  auto it = step_states_.find(step_id);
  return it == step_states_.end() ? nullptr : &it->second;
}

} // namespace keel
