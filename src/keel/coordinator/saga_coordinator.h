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

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "keel/common/saga.pb.h"
#include "keel/common/saga_types.h"
#include "keel/coordinator/coordinator_options.h"
#include "keel/coordinator/service_client.h"
#include "keel/util/macros.h"
#include "keel/util/oid_generator.h"
#include "keel/util/status.h"

namespace keel {

class Compensator;
class RecoveryManager;
class SagaExecution;
class SagaTxnStore;
class StepInvoker;
class ThreadPool;
class TimeoutMonitor;

// Orchestrates saga transactions: multi-step business transactions spanning
// independently-owned services, made eventually consistent by running a
// compensating action for every completed step when the saga can't finish.
//
// Every saga runs on a driver thread which dispatches the steps whose
// dependencies are completed to the step pool, and checkpoints the
// transaction record to the store after every transition. If a step fails
// for good, the saga is cancelled, or it runs past its timeout, the completed
// steps are compensated in reverse completion order.
//
// Transactions left behind by a coordinator that crashed are adopted by the
// recovery pass of another (or a restarted) coordinator once the lease of
// their previous owner expired.
//
// Usage:
//   SagaCoordinator coordinator(SagaCoordinatorOptions(), store);
//   CHECK_OK(coordinator.Init());
//   CHECK_OK(coordinator.RegisterServiceClient("payments", payments_client));
//   std::string txn_id;
//   RETURN_NOT_OK(coordinator.StartSaga("", steps, &txn_id));
//   ...
//   coordinator.Shutdown();
class SagaCoordinator {
 public:
  // 'store' must outlive the coordinator.
  SagaCoordinator(SagaCoordinatorOptions opts, SagaTxnStore* store);
  ~SagaCoordinator();

  // Starts the worker pools and, if enabled, the background tasks.
  Status Init() WARN_UNUSED_RESULT;

  // Stops the background tasks, interrupts running steps and retry backoffs,
  // and waits for the worker threads to exit. Sagas in progress stay Running
  // or Compensating in the store and are resumed by a later recovery pass.
  void Shutdown();

  // Binds 'service_name' to 'client' for the steps of subsequent sagas.
  Status RegisterServiceClient(const std::string& service_name,
                               std::shared_ptr<ServiceClient> client) WARN_UNUSED_RESULT;

  // Starts a saga made of 'steps' and returns without waiting for it to run.
  // If 'saga_id' is empty an id is generated. The id of the transaction is
  // returned in 'txn_id'.
  //
  // Returns Status::InvalidArgument if the definition is invalid, and
  // Status::AlreadyPresent if a transaction with this id exists. Nothing is
  // persisted in these cases.
  Status StartSaga(const std::string& saga_id,
                   const std::vector<SagaStep>& steps,
                   int32_t saga_timeout_s,
                   std::string* txn_id) WARN_UNUSED_RESULT;

  // Same as above, with the default saga timeout.
  Status StartSaga(const std::string& saga_id,
                   const std::vector<SagaStep>& steps,
                   std::string* txn_id) WARN_UNUSED_RESULT;

  // Reads the durable record of a transaction. Returns Status::NotFound if
  // there is no such transaction.
  Status GetTransactionStatus(const std::string& txn_id,
                              SagaTxnRecordPB* record) WARN_UNUSED_RESULT;

  // Cancels a saga: sets 'cancelled' to true if the transaction was Running
  // on this coordinator and its transition to Compensating was persisted.
  // The steps in flight finish before the completed steps are compensated.
  Status CancelTransaction(const std::string& txn_id, bool* cancelled) WARN_UNUSED_RESULT;

  // Runs one recovery pass: renews the leases of the transactions driven by
  // this coordinator, then adopts and resumes the Running, Compensating and
  // Failed transactions that are not driven by any live coordinator.
  // Sets 'num_recovered' to the number of adopted transactions, if not null.
  Status RecoverOrphanedTransactions(int* num_recovered = nullptr) WARN_UNUSED_RESULT;

  // Runs one timeout pass: marks Failed the Pending and Running transactions
  // that are past their timeout, and compensates them. Sets 'num_aborted' to
  // the number of such transactions, if not null. If the Failed status of a
  // saga driven here can't be persisted, it is compensated anyway and the
  // first such error is returned once the pass is over.
  Status AbortTimedOutTransactions(int* num_aborted = nullptr) WARN_UNUSED_RESULT;

  const std::string& instance_id() const { return instance_id_; }
  const SagaCoordinatorOptions& options() const { return opts_; }

  // Number of transactions this coordinator drives at the moment.
  int num_active_transactions() const;

  // Whether this coordinator drives 'txn_id' at the moment.
  bool IsActive(const std::string& txn_id) const;

 private:
  friend class Compensator;

  typedef std::unordered_map<std::string, std::shared_ptr<SagaExecution>> ExecutionMap;

  // Returns an error unless Init() was called and Shutdown() was not.
  Status CheckRunning() const;

  bool shutting_down() const { return shutting_down_.load(); }

  // Writes the state of 'exec' to the store, renewing this coordinator's
  // lease over it.
  Status Checkpoint(SagaExecution* exec) WARN_UNUSED_RESULT;

  // Adds 'exec' to the transactions driven by this coordinator. Returns
  // Status::AlreadyPresent if it is driven already.
  Status RegisterExecution(const std::shared_ptr<SagaExecution>& exec);
  void UnregisterExecution(const std::string& txn_id);
  std::shared_ptr<SagaExecution> FindExecution(const std::string& txn_id) const;
  std::vector<std::shared_ptr<SagaExecution>> ActiveExecutions() const;

  // Submits the driver of 'exec' to the driver pool: the scheduling loop
  // for a Running saga, a compensation sweep otherwise.
  Status SubmitDriver(const std::shared_ptr<SagaExecution>& exec);

  // Driver of a Running saga: runs the scheduling loop, then completes the
  // saga or compensates it.
  void DriveSaga(const std::shared_ptr<SagaExecution>& exec);

  // Driver of a saga in compensation.
  void DriveCompensation(const std::shared_ptr<SagaExecution>& exec);

  // Dispatches the ready steps of 'exec' until every step is Completed
  // (returns OK), a step failed, an abort was requested, or the coordinator
  // shuts down (returns the reason).
  Status RunSchedulingLoop(const std::shared_ptr<SagaExecution>& exec);

  // Executes one step on the step pool.
  void ExecuteStep(const std::shared_ptr<SagaExecution>& exec, const std::string& step_id);

  // Waits for 'delay' before a step retry. Returns false if the retry must
  // not happen because the saga is aborted or the coordinator shuts down.
  bool WaitBeforeRetry(SagaExecution* exec, const MonoDelta& delay);

  // Marks an orphaned timed out transaction Failed and compensates it.
  Status AbortOrphanedTransaction(const SagaTxnRecordPB& record, int64_t now_us);

  int64_t LeaseExpiry() const;

  std::string LogPrefix(const std::string& txn_id) const;

  SagaCoordinatorOptions opts_;
  SagaTxnStore* const store_;
  std::string instance_id_;

  ObjectIdGenerator oid_generator_;
  ServiceClientRegistry registry_;

  std::unique_ptr<ThreadPool> driver_pool_;
  std::unique_ptr<ThreadPool> step_pool_;
  std::unique_ptr<ThreadPool> call_pool_;
  std::unique_ptr<StepInvoker> invoker_;
  std::unique_ptr<Compensator> compensator_;
  std::unique_ptr<RecoveryManager> recovery_manager_;
  std::unique_ptr<TimeoutMonitor> timeout_monitor_;

  std::atomic<bool> initted_;
  std::atomic<bool> shutting_down_;

  // Protects 'executions_'.
  mutable std::mutex lock_;
  ExecutionMap executions_;

  DISALLOW_COPY_AND_ASSIGN(SagaCoordinator);
};

} // namespace keel
