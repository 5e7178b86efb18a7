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
#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "keel/common/saga.pb.h"
#include "keel/common/saga_types.h"
#include "keel/util/macros.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"

namespace keel {

class SagaTxnStore;

// The execution state of one step.
struct StepExecution {
  std::string step_id;
  StepStatus status = StepStatus::kPending;
  int64_t start_time_us = 0;
  int64_t end_time_us = 0;
  Payload result;
  std::string error;
  std::string compensation_error;
  int32_t retries_used = 0;
};

// The in-memory state of a saga transaction driven by this coordinator
// instance. It mirrors the durable SagaTxnRecordPB and is written back to the
// store by Checkpoint() after every transition.
//
// The definition is immutable. Everything else is protected by a
// per-transaction lock, so the methods below may be called concurrently by
// the scheduling loop and the step tasks.
class SagaExecution {
 public:
  // Where the scheduling loop stands.
  enum class Progress {
    // Some steps are not yet Completed and none failed.
    kInProgress,
    // Every step is Completed.
    kAllCompleted,
    // At least one step is Failed.
    kStepFailed,
  };

  // Creates the state of a new saga with every step Pending.
  SagaExecution(std::string txn_id,
                std::vector<SagaStep> steps,
                int64_t created_at_us,
                int64_t timeout_at_us);

  // Rebuilds the state from a durable record. Unknown statuses, steps missing
  // from the definition and malformed definitions are rejected with
  // Status::Corruption.
  static Status FromRecord(const SagaTxnRecordPB& record,
                           std::unique_ptr<SagaExecution>* execution) WARN_UNUSED_RESULT;

  const std::string& txn_id() const { return txn_id_; }
  const std::vector<SagaStep>& steps() const { return steps_; }
  int64_t created_at_us() const { return created_at_us_; }
  int64_t timeout_at_us() const { return timeout_at_us_; }

  // Returns the definition of 'step_id', or nullptr if there is no such step.
  const SagaStep* FindStep(const std::string& step_id) const;

  // Serializes the current state. The lease fields and 'updated_at_us' are
  // left unset.
  void ToRecordPB(SagaTxnRecordPB* record) const;

  // Writes the current state to 'store', claiming the record for 'owner_id'
  // until 'lease_expires_at_us'. Checkpoints of one transaction are
  // serialized, so a checkpoint never overwrites a newer one.
  Status Checkpoint(SagaTxnStore* store,
                    const std::string& owner_id,
                    int64_t lease_expires_at_us) WARN_UNUSED_RESULT;

  SagaStatus status() const;
  void set_status(SagaStatus status);

  // Atomically moves the saga from 'from' to 'to'. Returns false, changing
  // nothing, if the saga is not in 'from'.
  bool TransitionStatus(SagaStatus from, SagaStatus to);

  // Computes the ready set (Pending steps whose dependencies are all
  // Completed), marks its members Running as of 'now_us' and returns their
  // ids in definition order. Nothing is ready once the saga is halted (see
  // below).
  std::vector<std::string> TakeReadySteps(int64_t now_us);

  // Puts a step taken by TakeReadySteps() back to Pending if the saga halted
  // before its action was called: it left Running, an abort was requested, or
  // a step failed. Returns true if the step was put back.
  bool ReleaseStepIfHalted(const std::string& step_id);

  Progress GetProgress() const;

  // Whether any step is Pending or Running.
  bool HasUnfinishedSteps() const;
  bool HasRunningSteps() const;

  // Records the outcome of a step's action.
  void MarkStepCompleted(const std::string& step_id, Payload result,
                         int32_t retries_used, int64_t now_us);
  void MarkStepFailed(const std::string& step_id, const std::string& error,
                      int32_t retries_used, int64_t now_us);

  // Compensation bookkeeping. A failed compensation is recorded in the step's
  // 'compensation_error' and counted, but the step still ends Compensated.
  void MarkStepCompensating(const std::string& step_id);
  void MarkStepCompensated(const std::string& step_id, const Status& compensation_status);

  // Returns a copy of the execution state of 'step_id'. The step must exist.
  StepExecution GetStepExecution(const std::string& step_id) const;

  std::vector<std::string> completed_steps() const;
  std::vector<std::string> failed_steps() const;
  int32_t recovery_count() const;
  int32_t compensation_failures() const;

  // Prepares a state rebuilt by FromRecord() to be driven again: steps that
  // were Running when the previous owner stopped are reset to Pending and
  // will be invoked again.
  void PrepareForRecovery();

  // Asks the scheduling loop to stop dispatching steps and hand the saga to
  // compensation. The first reason given is kept.
  void RequestAbort(const std::string& reason);
  bool abort_requested() const;
  std::string abort_reason() const;

  // Monotonically increasing count of state changes, for use with
  // WaitForChange().
  uint64_t change_count() const;

  // Waits until the state changed after 'since' (a value of change_count()),
  // or until 'timeout' elapses. Returns true if the state changed.
  bool WaitForChange(uint64_t since, const MonoDelta& timeout) const;

  // Wakes up all the waiters of WaitForChange().
  void Notify();

 private:
  SagaExecution(std::string txn_id,
                std::vector<SagaStep> steps,
                std::map<std::string, StepExecution> step_states,
                int64_t created_at_us,
                int64_t timeout_at_us);

  StepExecution* FindStepStateUnlocked(const std::string& step_id);
  const StepExecution* FindStepStateUnlocked(const std::string& step_id) const;
  void ExecutionLogToPBUnlocked(SagaExecutionLogPB* log) const;
  bool IsHaltedUnlocked() const;

  // Must be called with 'lock_' held.
  void NotifyUnlocked();

  const std::string txn_id_;
  const std::vector<SagaStep> steps_;
  const int64_t created_at_us_;
  const int64_t timeout_at_us_;

  // Serializes Checkpoint() calls. Acquired before 'lock_'.
  std::mutex checkpoint_lock_;

  mutable std::mutex lock_;
  mutable std::condition_variable cond_;

  SagaStatus status_;
  std::map<std::string, StepExecution> step_states_;
  std::vector<std::string> completed_steps_;
  std::vector<std::string> failed_steps_;
  int32_t recovery_count_;
  int32_t compensation_failures_;
  bool abort_requested_;
  std::string abort_reason_;
  uint64_t change_count_;

  DISALLOW_COPY_AND_ASSIGN(SagaExecution);
};

} // namespace keel
