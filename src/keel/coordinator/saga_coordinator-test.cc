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

#include <atomic>
#include <cstdlib>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <absl/strings/substitute.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "keel/common/saga.pb.h"
#include "keel/common/saga_types.h"
#include "keel/coordinator/coordinator_options.h"
#include "keel/coordinator/saga-test-util.h"
#include "keel/coordinator/saga_execution.h"
#include "keel/storage/saga_txn_store.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"
#include "keel/util/test_util.h"
#include "keel/util/wall_clock.h"

using std::set;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;

namespace keel {

namespace {

// Store whose writes fail while 'fail_writes' is set, and for the next
// 'fail_next_upserts' upserts.
class FlakySagaTxnStore : public SagaTxnStore {
 public:
  FlakySagaTxnStore() : fail_writes(false), fail_next_upserts(0) {}

  Status Upsert(const SagaTxnRecordPB& record) override {
    int n = fail_next_upserts.load();
    while (n > 0 && !fail_next_upserts.compare_exchange_weak(n, n - 1)) {
    }
    if (fail_writes || n > 0) {
      return Status::IOError("injected store failure");
    }
    return delegate_.Upsert(record);
  }
  Status Get(const string& txn_id, SagaTxnRecordPB* record) override {
    return delegate_.Get(txn_id, record);
  }
  Status List(const SagaTxnFilter& filter, vector<SagaTxnRecordPB>* records) override {
    return delegate_.List(filter, records);
  }
  Status TryAcquireLease(const string& txn_id, const string& owner_id, int64_t now_us,
                         int64_t expires_at_us, SagaTxnRecordPB* record) override {
    if (fail_writes) {
      return Status::IOError("injected store failure");
    }
    return delegate_.TryAcquireLease(txn_id, owner_id, now_us, expires_at_us, record);
  }

  std::atomic<bool> fail_writes;
  std::atomic<int> fail_next_upserts;

 private:
  InMemorySagaTxnStore delegate_;
};

const StepExecutionPB& FindStepPB(const SagaTxnRecordPB& record, const string& step_id) {
  for (const auto& step : record.execution_log().steps()) {
    if (step.step_id() == step_id) {
      return step;
    }
  }
  LOG(FATAL) << "no step " << step_id << " in " << record.ShortDebugString();
}

} // anonymous namespace

class SagaCoordinatorTest : public KeelTest {
 protected:
  void SetUp() override {
    KeelTest::SetUp();
    store_.reset(new FlakySagaTxnStore());
    client_ = std::make_shared<MockServiceClient>();
    ASSERT_OK(StartCoordinator(Options("coord-1"), &coordinator_));
  }

  void TearDown() override {
    for (auto* c : { &coordinator_, &coordinator2_ }) {
      if (*c) {
        (*c)->Shutdown();
      }
    }
    KeelTest::TearDown();
  }

  static SagaCoordinatorOptions Options(const string& instance_id) {
    SagaCoordinatorOptions opts;
    opts.instance_id = instance_id;
    opts.enable_background_tasks = false;
    opts.retry_backoff_base = MonoDelta::FromMilliseconds(10);
    opts.scheduler_poll_interval = MonoDelta::FromMilliseconds(10);
    opts.lease_duration = MonoDelta::FromSeconds(60);
    return opts;
  }

  Status StartCoordinator(const SagaCoordinatorOptions& opts,
                          unique_ptr<SagaCoordinator>* coordinator) {
    if (*coordinator) {
      (*coordinator)->Shutdown();
    }
    coordinator->reset(new SagaCoordinator(opts, store_.get()));
    RETURN_NOT_OK((*coordinator)->Init());
    for (const char* service : { "inventory", "payments", "shipping" }) {
      RETURN_NOT_OK((*coordinator)->RegisterServiceClient(service, client_));
    }
    return Status::OK();
  }

  // A step calling '<id>_do' and compensated by '<id>_undo'.
  static SagaStep MakeStep(const string& id, const set<string>& deps = {},
                           int32_t retry_count = 0) {
    SagaStep step;
    step.step_id = id;
    step.service_name = "inventory";
    step.action = id + "_do";
    step.compensation_action = id + "_undo";
    step.payload = { { "step", id } };
    step.timeout_s = 5;
    step.retry_count = retry_count;
    step.depends_on = deps;
    return step;
  }

  // Steps each depending on the previous one.
  static vector<SagaStep> MakeChain(const vector<string>& ids) {
    vector<SagaStep> steps;
    for (size_t i = 0; i < ids.size(); i++) {
      steps.push_back(i == 0 ? MakeStep(ids[i]) : MakeStep(ids[i], { ids[i - 1] }));
    }
    return steps;
  }

  void WaitForStatus(const string& txn_id, SagaStatusPB expected,
                     SagaTxnRecordPB* record = nullptr) {
    SagaTxnRecordPB r;
    ASSERT_EVENTUALLY([&]() {
      ASSERT_OK(store_->Get(txn_id, &r));
      ASSERT_EQ(SagaStatusPB_Name(expected), SagaStatusPB_Name(r.status()))
          << r.ShortDebugString();
    });
    if (record) {
      *record = r;
    }
  }

  // Waits until the driver let go of 'txn_id'.
  void WaitForInactive(SagaCoordinator* coordinator, const string& txn_id) {
    ASSERT_EVENTUALLY([&]() {
      ASSERT_FALSE(coordinator->IsActive(txn_id));
    });
  }

  // Writes the state of 'exec' as left by a coordinator that stopped, with an
  // expired lease.
  void SeedOrphan(SagaExecution* exec) {
    ASSERT_OK(exec->Checkpoint(store_.get(), "dead-coordinator",
                               GetCurrentTimeMicros() - 1));
  }

  static unique_ptr<SagaExecution> NewExecution(const string& txn_id,
                                                const vector<string>& step_ids) {
    int64_t now_us = GetCurrentTimeMicros();
    unique_ptr<SagaExecution> exec(new SagaExecution(
        txn_id, MakeChain(step_ids), now_us,
        now_us + MonoDelta::FromSeconds(60).ToMicroseconds()));
    exec->set_status(SagaStatus::kRunning);
    return exec;
  }

  // Runs the steps of 'exec' in order and marks them completed.
  static void CompleteSteps(SagaExecution* exec, const vector<string>& step_ids) {
    for (const auto& id : step_ids) {
      ASSERT_EQ(vector<string>{ id }, exec->TakeReadySteps(GetCurrentTimeMicros()));
      exec->MarkStepCompleted(id, { { "id", id + "_do-result" } }, 0,
                              GetCurrentTimeMicros());
    }
  }

  unique_ptr<FlakySagaTxnStore> store_;
  shared_ptr<MockServiceClient> client_;
  unique_ptr<SagaCoordinator> coordinator_;
  unique_ptr<SagaCoordinator> coordinator2_;
};

TEST_F(SagaCoordinatorTest, TestAllStepsComplete) {
  vector<SagaStep> steps = MakeChain({ "reserve", "charge", "ship" });
  steps[1].service_name = "payments";
  steps[2].service_name = "shipping";
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("order-1", steps, &txn_id));
  ASSERT_EQ("order-1", txn_id);

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED, &record));
  ASSERT_EQ((vector<string>{ "reserve_do", "charge_do", "ship_do" }), client_->actions());
  for (const auto& id : { "reserve", "charge", "ship" }) {
    const StepExecutionPB& step = FindStepPB(record, id);
    EXPECT_EQ(STEP_COMPLETED, step.status());
    EXPECT_EQ(0, step.retries_used());
    EXPECT_EQ(string(id) + "_do-result", step.result().at("id"));
    EXPECT_GT(step.end_time_us(), 0);
  }
  ASSERT_EQ("coord-1", record.owner_id());
  ASSERT_EQ(0, record.recovery_count());
  NO_FATALS(WaitForInactive(coordinator_.get(), txn_id));
}

TEST_F(SagaCoordinatorTest, TestGeneratedTransactionId) {
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", { MakeStep("a") }, &txn_id));
  ASSERT_EQ(32, txn_id.size());
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED));

  SagaTxnRecordPB record;
  ASSERT_OK(coordinator_->GetTransactionStatus(txn_id, &record));
  ASSERT_EQ(txn_id, record.transaction_id());
  Status s = coordinator_->GetTransactionStatus("no-such-txn", &record);
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();
}

TEST_F(SagaCoordinatorTest, TestRetriesExhaustedCompensates) {
  vector<SagaStep> steps = { MakeStep("reserve"), MakeStep("charge", { "reserve" }, 3) };
  client_->FailAction("charge_do", -1);
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("order-2", steps, &txn_id));

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  ASSERT_EQ(4, client_->CallCount("charge_do"));
  ASSERT_EQ(1, client_->CallCount("reserve_undo"));
  ASSERT_EQ(0, client_->CallCount("charge_undo"));

  const StepExecutionPB& charge = FindStepPB(record, "charge");
  ASSERT_EQ(STEP_FAILED, charge.status());
  ASSERT_EQ(4, charge.retries_used());
  ASSERT_STR_CONTAINS(charge.error(), "injected failure");
  ASSERT_EQ(STEP_COMPENSATED, FindStepPB(record, "reserve").status());
  ASSERT_EQ(vector<string>{ "charge" },
            vector<string>(record.execution_log().failed_steps().begin(),
                           record.execution_log().failed_steps().end()));
}

TEST_F(SagaCoordinatorTest, TestRetrySucceeds) {
  client_->FailAction("a_do", 2);
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", { MakeStep("a", {}, 3) }, &txn_id));
  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED, &record));
  ASSERT_EQ(3, client_->CallCount("a_do"));
  ASSERT_EQ(2, FindStepPB(record, "a").retries_used());
}

TEST_F(SagaCoordinatorTest, TestCompensationRunsInReverseOrder) {
  client_->FailAction("d_do", -1);
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", MakeChain({ "a", "b", "c", "d" }), &txn_id));

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  ASSERT_EQ((vector<string>{ "a_do", "b_do", "c_do", "d_do", "c_undo", "b_undo", "a_undo" }),
            client_->actions());
  for (const auto& id : { "a", "b", "c" }) {
    EXPECT_EQ(STEP_COMPENSATED, FindStepPB(record, id).status()) << id;
  }
  ASSERT_EQ(STEP_FAILED, FindStepPB(record, "d").status());
  ASSERT_EQ(0, record.compensation_failures());
}

TEST_F(SagaCoordinatorTest, TestStepsFollowDependencies) {
  vector<SagaStep> steps = { MakeStep("a"), MakeStep("b", { "a" }), MakeStep("c", { "a" }),
                             MakeStep("d", { "b", "c" }) };
  client_->SetLatency("b_do", MonoDelta::FromMilliseconds(200));
  client_->SetLatency("c_do", MonoDelta::FromMilliseconds(200));
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", steps, &txn_id));

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED, &record));
  const StepExecutionPB& a = FindStepPB(record, "a");
  const StepExecutionPB& b = FindStepPB(record, "b");
  const StepExecutionPB& c = FindStepPB(record, "c");
  const StepExecutionPB& d = FindStepPB(record, "d");
  ASSERT_GE(b.start_time_us(), a.end_time_us());
  ASSERT_GE(c.start_time_us(), a.end_time_us());
  ASSERT_GE(d.start_time_us(), b.end_time_us());
  ASSERT_GE(d.start_time_us(), c.end_time_us());
  // 'b' and 'c' are independent of each other and run concurrently.
  ASSERT_EQ(2, client_->max_in_flight());
  ASSERT_EQ("d_do", client_->actions().back());
}

TEST_F(SagaCoordinatorTest, TestBoundedFanOut) {
  SagaCoordinatorOptions opts = Options("coord-1");
  opts.step_pool_max_threads = 2;
  ASSERT_OK(StartCoordinator(opts, &coordinator_));

  vector<SagaStep> steps;
  for (int i = 0; i < 6; i++) {
    steps.push_back(MakeStep("s" + std::to_string(i)));
    client_->SetLatency(steps.back().action, MonoDelta::FromMilliseconds(50));
  }
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", steps, &txn_id));
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED));
  ASSERT_EQ(6, client_->calls().size());
  ASSERT_LE(client_->max_in_flight(), 2);
}

TEST_F(SagaCoordinatorTest, TestCancel) {
  client_->BlockAction("b_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", MakeChain({ "a", "b", "c" }), &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("b_do"));
  });

  bool cancelled = false;
  ASSERT_OK(coordinator_->CancelTransaction(txn_id, &cancelled));
  ASSERT_TRUE(cancelled);
  SagaTxnRecordPB record;
  ASSERT_OK(coordinator_->GetTransactionStatus(txn_id, &record));
  ASSERT_EQ(SAGA_COMPENSATING, record.status());

  // Only a Running saga can be cancelled.
  ASSERT_OK(coordinator_->CancelTransaction(txn_id, &cancelled));
  ASSERT_FALSE(cancelled);

  // The step in flight finishes, then is compensated with the others.
  client_->Unblock("b_do");
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  ASSERT_EQ((vector<string>{ "a_do", "b_do", "b_undo", "a_undo" }), client_->actions());
  ASSERT_EQ(STEP_PENDING, FindStepPB(record, "c").status());

  Status s = coordinator_->CancelTransaction("no-such-txn", &cancelled);
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();
  ASSERT_FALSE(cancelled);
}

// Steps queued behind a busy step pool when the saga is cancelled never call
// their action.
TEST_F(SagaCoordinatorTest, TestCancelledSagaDoesNotStartQueuedSteps) {
  SagaCoordinatorOptions opts = Options("coord-1");
  opts.step_pool_max_threads = 1;
  ASSERT_OK(StartCoordinator(opts, &coordinator_));

  client_->BlockAction("a_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", { MakeStep("a"), MakeStep("b") }, &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("a_do"));
  });

  bool cancelled = false;
  ASSERT_OK(coordinator_->CancelTransaction(txn_id, &cancelled));
  ASSERT_TRUE(cancelled);
  client_->Unblock("a_do");

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  ASSERT_EQ((vector<string>{ "a_do", "a_undo" }), client_->actions());
  ASSERT_EQ(STEP_COMPENSATED, FindStepPB(record, "a").status());
  const StepExecutionPB& b = FindStepPB(record, "b");
  ASSERT_EQ(STEP_PENDING, b.status());
  ASSERT_FALSE(b.has_start_time_us());
}

// Once a step failed, the steps still queued are not started.
TEST_F(SagaCoordinatorTest, TestFailedStepStopsQueuedSteps) {
  SagaCoordinatorOptions opts = Options("coord-1");
  opts.step_pool_max_threads = 1;
  ASSERT_OK(StartCoordinator(opts, &coordinator_));

  client_->FailAction("a_do", -1);
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga(
      "", { MakeStep("a"), MakeStep("b"), MakeStep("c") }, &txn_id));

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  ASSERT_EQ(vector<string>{ "a_do" }, client_->actions());
  ASSERT_EQ(STEP_FAILED, FindStepPB(record, "a").status());
  ASSERT_EQ(STEP_PENDING, FindStepPB(record, "b").status());
  ASSERT_EQ(STEP_PENDING, FindStepPB(record, "c").status());
}

TEST_F(SagaCoordinatorTest, TestCancelFinishedSaga) {
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", { MakeStep("a") }, &txn_id));
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED));
  NO_FATALS(WaitForInactive(coordinator_.get(), txn_id));
  bool cancelled = true;
  ASSERT_OK(coordinator_->CancelTransaction(txn_id, &cancelled));
  ASSERT_FALSE(cancelled);
  ASSERT_EQ(0, client_->CallCount("a_undo"));
}

TEST_F(SagaCoordinatorTest, TestStepTimeout) {
  SagaStep step = MakeStep("b", { "a" });
  step.timeout_s = 1;
  client_->SetLatency("b_do", MonoDelta::FromSeconds(3));
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", { MakeStep("a"), step }, &txn_id));

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  const StepExecutionPB& b = FindStepPB(record, "b");
  ASSERT_EQ(STEP_FAILED, b.status());
  ASSERT_STR_CONTAINS(b.error(), "Timed out");
  ASSERT_EQ(1, client_->CallCount("a_undo"));
}

TEST_F(SagaCoordinatorTest, TestSagaTimeout) {
  client_->BlockAction("b_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", MakeChain({ "a", "b", "c" }), 1, &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("b_do"));
  });

  int num_aborted = -1;
  ASSERT_OK(coordinator_->AbortTimedOutTransactions(&num_aborted));
  ASSERT_EQ(0, num_aborted);

  SleepFor(MonoDelta::FromMilliseconds(1100));
  ASSERT_OK(coordinator_->AbortTimedOutTransactions(&num_aborted));
  ASSERT_EQ(1, num_aborted);
  SagaTxnRecordPB record;
  ASSERT_OK(coordinator_->GetTransactionStatus(txn_id, &record));
  ASSERT_TRUE(record.status() == SAGA_FAILED || record.status() == SAGA_COMPENSATING)
      << record.ShortDebugString();

  client_->Unblock("b_do");
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED));
  ASSERT_EQ((vector<string>{ "a_do", "b_do", "b_undo", "a_undo" }), client_->actions());
}

// A timeout that can't be persisted fails the pass, but the saga is still
// compensated.
TEST_F(SagaCoordinatorTest, TestSagaTimeoutPersistFailure) {
  client_->BlockAction("a_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", MakeChain({ "a", "b" }), 1, &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("a_do"));
  });

  SleepFor(MonoDelta::FromMilliseconds(1100));
  store_->fail_next_upserts = 1;
  int num_aborted = -1;
  Status s = coordinator_->AbortTimedOutTransactions(&num_aborted);
  ASSERT_TRUE(s.IsIOError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unable to persist saga timeout");
  ASSERT_EQ(1, num_aborted);

  client_->Unblock("a_do");
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED));
  ASSERT_EQ((vector<string>{ "a_do", "a_undo" }), client_->actions());
}

TEST_F(SagaCoordinatorTest, TestInvalidSagasAreNotPersisted) {
  string txn_id;
  vector<vector<SagaStep>> invalid = {
    {},
    { MakeStep("a"), MakeStep("a") },
    { MakeStep("a", { "missing" }) },
    { MakeStep("a", { "c" }), MakeStep("b", { "a" }), MakeStep("c", { "b" }) },
  };
  SagaStep unknown_service = MakeStep("a");
  unknown_service.service_name = "billing";
  invalid.push_back({ unknown_service });
  for (const auto& steps : invalid) {
    Status s = coordinator_->StartSaga("", steps, &txn_id);
    ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  }
  Status s = coordinator_->StartSaga("a/b", { MakeStep("a") }, &txn_id);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  s = coordinator_->StartSaga("", { MakeStep("a") }, 0, &txn_id);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();

  vector<SagaTxnRecordPB> records;
  ASSERT_OK(store_->List(SagaTxnFilter(), &records));
  ASSERT_TRUE(records.empty());
  ASSERT_TRUE(client_->calls().empty());
}

TEST_F(SagaCoordinatorTest, TestDuplicateTransactionId) {
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("order-1", { MakeStep("a") }, &txn_id));
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED));
  Status s = coordinator_->StartSaga("order-1", { MakeStep("b") }, &txn_id);
  ASSERT_TRUE(s.IsAlreadyPresent()) << s.ToString();
  ASSERT_EQ(0, client_->CallCount("b_do"));
}

TEST_F(SagaCoordinatorTest, TestStartFailsWhenStoreFails) {
  store_->fail_writes = true;
  string txn_id;
  Status s = coordinator_->StartSaga("order-1", { MakeStep("a") }, &txn_id);
  ASSERT_TRUE(s.IsIOError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unable to checkpoint");
  ASSERT_EQ(0, coordinator_->num_active_transactions());
  SagaTxnRecordPB record;
  ASSERT_TRUE(coordinator_->GetTransactionStatus("order-1", &record).IsNotFound());
  ASSERT_TRUE(client_->calls().empty());
}

// A saga whose checkpoints fail is abandoned, then resumed by a recovery
// pass once the store is back.
TEST_F(SagaCoordinatorTest, TestRecoversAfterStoreOutage) {
  client_->BlockAction("a_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", MakeChain({ "a", "b" }), &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("a_do"));
  });
  store_->fail_writes = true;
  client_->Unblock("a_do");
  NO_FATALS(WaitForInactive(coordinator_.get(), txn_id));

  SagaTxnRecordPB record;
  ASSERT_OK(coordinator_->GetTransactionStatus(txn_id, &record));
  ASSERT_EQ(SAGA_RUNNING, record.status());
  ASSERT_EQ(STEP_RUNNING, FindStepPB(record, "a").status());

  store_->fail_writes = false;
  int num_recovered = 0;
  ASSERT_OK(coordinator_->RecoverOrphanedTransactions(&num_recovered));
  ASSERT_EQ(1, num_recovered);
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED, &record));
  ASSERT_EQ(2, client_->CallCount("a_do"));
  ASSERT_EQ(1, record.recovery_count());
}

// A saga left Compensating resumes compensation where it stopped: the step
// being compensated is compensated again, compensated steps are skipped and
// no action runs forward.
TEST_F(SagaCoordinatorTest, TestRecoversCompensatingSaga) {
  unique_ptr<SagaExecution> exec = NewExecution("compensating-1", { "a", "b", "c" });
  NO_FATALS(CompleteSteps(exec.get(), { "a", "b", "c" }));
  ASSERT_TRUE(exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kCompensating));
  exec->MarkStepCompensating("c");
  exec->MarkStepCompensated("c", Status::OK());
  exec->MarkStepCompensating("b");
  NO_FATALS(SeedOrphan(exec.get()));

  int num_recovered = 0;
  ASSERT_OK(coordinator_->RecoverOrphanedTransactions(&num_recovered));
  ASSERT_EQ(1, num_recovered);

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus("compensating-1", SAGA_COMPENSATED, &record));
  ASSERT_EQ((vector<string>{ "b_undo", "a_undo" }), client_->actions());
  for (const auto& id : { "a", "b", "c" }) {
    EXPECT_EQ(STEP_COMPENSATED, FindStepPB(record, id).status()) << id;
  }
  ASSERT_EQ("coord-1", record.owner_id());
  ASSERT_EQ(1, record.recovery_count());
  ASSERT_EQ(0, record.compensation_failures());
}

// A saga left Failed, before its compensation started, is compensated.
TEST_F(SagaCoordinatorTest, TestRecoversFailedSaga) {
  unique_ptr<SagaExecution> exec = NewExecution("failed-1", { "a", "b", "c" });
  NO_FATALS(CompleteSteps(exec.get(), { "a", "b" }));
  ASSERT_EQ(vector<string>{ "c" }, exec->TakeReadySteps(GetCurrentTimeMicros()));
  exec->MarkStepFailed("c", "Remote error: injected failure", 1, GetCurrentTimeMicros());
  ASSERT_TRUE(exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kFailed));
  NO_FATALS(SeedOrphan(exec.get()));

  int num_recovered = 0;
  ASSERT_OK(coordinator_->RecoverOrphanedTransactions(&num_recovered));
  ASSERT_EQ(1, num_recovered);

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus("failed-1", SAGA_COMPENSATED, &record));
  ASSERT_EQ((vector<string>{ "b_undo", "a_undo" }), client_->actions());
  ASSERT_EQ(STEP_FAILED, FindStepPB(record, "c").status());
  // The compensation of 'b' received the result of its action.
  const vector<MockServiceClient::CallRecord> calls = client_->calls();
  ASSERT_EQ("b_do-result", calls[0].payload.at(string(kOriginalResultPrefix) + "id"));
}

// Records leased by live coordinators don't use up the scan limit, so an
// orphan listed after them is still adopted.
TEST_F(SagaCoordinatorTest, TestRecoveryScanSkipsLiveLeases) {
  SagaCoordinatorOptions opts = Options("coord-1");
  opts.background_scan_limit = 1;
  ASSERT_OK(StartCoordinator(opts, &coordinator_));

  unique_ptr<SagaExecution> leased = NewExecution("a-leased", { "a" });
  ASSERT_OK(leased->Checkpoint(store_.get(), "live-coordinator",
                               GetCurrentTimeMicros() +
                               MonoDelta::FromSeconds(60).ToMicroseconds()));
  unique_ptr<SagaExecution> orphan = NewExecution("b-orphan", { "a" });
  NO_FATALS(SeedOrphan(orphan.get()));

  int num_recovered = 0;
  ASSERT_OK(coordinator_->RecoverOrphanedTransactions(&num_recovered));
  ASSERT_EQ(1, num_recovered);
  NO_FATALS(WaitForStatus("b-orphan", SAGA_COMPLETED));

  SagaTxnRecordPB record;
  ASSERT_OK(store_->Get("a-leased", &record));
  ASSERT_EQ(SAGA_RUNNING, record.status());
  ASSERT_EQ("live-coordinator", record.owner_id());
  ASSERT_EQ(1, client_->CallCount("a_do"));
}

TEST_F(SagaCoordinatorTest, TestCompensationFailureDoesNotStopCompensation) {
  client_->FailAction("c_do", -1);
  client_->FailAction("b_undo", -1);
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", MakeChain({ "a", "b", "c" }), &txn_id));

  SagaTxnRecordPB record;
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED, &record));
  ASSERT_EQ(1, client_->CallCount("b_undo"));
  ASSERT_EQ(1, client_->CallCount("a_undo"));
  ASSERT_EQ(1, record.compensation_failures());
  const StepExecutionPB& b = FindStepPB(record, "b");
  ASSERT_EQ(STEP_COMPENSATED, b.status());
  ASSERT_STR_CONTAINS(b.compensation_error(), "injected failure");
  ASSERT_FALSE(FindStepPB(record, "a").has_compensation_error());
}

TEST_F(SagaCoordinatorTest, TestCompensationPayloadCarriesResult) {
  client_->FailAction("b_do", -1);
  SagaStep a = MakeStep("a");
  a.payload = { { "sku", "X-1" }, { "qty", "2" } };
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", { a, MakeStep("b", { "a" }) }, &txn_id));
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED));

  bool found = false;
  for (const auto& call : client_->calls()) {
    if (call.action != "a_undo") {
      continue;
    }
    found = true;
    EXPECT_EQ("X-1", call.payload.at("sku"));
    EXPECT_EQ("2", call.payload.at("qty"));
    EXPECT_EQ("a_do-result", call.payload.at(string(kOriginalResultPrefix) + "id"));
  }
  ASSERT_TRUE(found);
}

// A coordinator which went away leaves its saga Running; another one adopts
// it once the lease of the first expired, and re-runs the step in flight.
TEST_F(SagaCoordinatorTest, TestCrashRecovery) {
  SagaCoordinatorOptions opts = Options("coord-1");
  opts.lease_duration = MonoDelta::FromSeconds(2);
  ASSERT_OK(StartCoordinator(opts, &coordinator_));
  ASSERT_OK(StartCoordinator(Options("coord-2"), &coordinator2_));

  vector<SagaStep> steps = MakeChain({ "a", "b", "c" });
  steps[1].timeout_s = 1;
  client_->BlockAction("b_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", steps, &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("b_do"));
  });

  // The lease of 'coord-1' protects the saga while it is alive.
  int num_recovered = -1;
  ASSERT_OK(coordinator2_->RecoverOrphanedTransactions(&num_recovered));
  ASSERT_EQ(0, num_recovered);

  // Returns once the blocked call reached its deadline.
  coordinator_->Shutdown();
  client_->Unblock("b_do");

  SagaTxnRecordPB record;
  ASSERT_OK(store_->Get(txn_id, &record));
  ASSERT_EQ(SAGA_RUNNING, record.status());
  ASSERT_EQ(STEP_RUNNING, FindStepPB(record, "b").status());

  ASSERT_EVENTUALLY([&]() {
    int n = 0;
    ASSERT_OK(coordinator2_->RecoverOrphanedTransactions(&n));
    ASSERT_EQ(1, n);
  });
  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPLETED, &record));
  ASSERT_EQ(1, client_->CallCount("a_do"));
  ASSERT_EQ(2, client_->CallCount("b_do"));
  ASSERT_EQ(1, client_->CallCount("c_do"));
  ASSERT_EQ("coord-2", record.owner_id());
  ASSERT_EQ(1, record.recovery_count());
}

// An orphaned saga past its timeout is compensated by the background tasks
// of another coordinator.
TEST_F(SagaCoordinatorTest, TestOrphanedSagaTimesOut) {
  SagaCoordinatorOptions opts = Options("coord-1");
  opts.lease_duration = MonoDelta::FromMilliseconds(300);
  ASSERT_OK(StartCoordinator(opts, &coordinator_));

  vector<SagaStep> steps = MakeChain({ "a", "b" });
  steps[1].timeout_s = 1;
  // 'b' stays blocked, so the saga can only end compensated whichever of
  // recovery or the timeout monitor adopts it first.
  client_->BlockAction("b_do");
  string txn_id;
  ASSERT_OK(coordinator_->StartSaga("", steps, 1, &txn_id));
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(1, client_->CallCount("b_do"));
  });
  coordinator_->Shutdown();

  SagaCoordinatorOptions opts2 = Options("coord-2");
  opts2.enable_background_tasks = true;
  opts2.recovery_interval = MonoDelta::FromMilliseconds(100);
  opts2.timeout_check_interval = MonoDelta::FromMilliseconds(100);
  ASSERT_OK(StartCoordinator(opts2, &coordinator2_));

  NO_FATALS(WaitForStatus(txn_id, SAGA_COMPENSATED));
  ASSERT_EQ(1, client_->CallCount("a_undo"));
}

// Runs many sagas at once, a random subset of which fail on their last step.
TEST_F(SagaCoordinatorTest, TestManyConcurrentSagas) {
  SeedRandom();
  const int kNumSagas = AllowSlowTests() ? 500 : 50;
  vector<string> txn_ids;
  vector<bool> should_fail;
  for (int i = 0; i < kNumSagas; i++) {
    vector<SagaStep> steps = MakeChain({ "a", "b", "c" });
    for (auto& step : steps) {
      step.action = absl::Substitute("$0_$1_do", step.step_id, i);
      step.compensation_action = absl::Substitute("$0_$1_undo", step.step_id, i);
    }
    bool fail = rand() % 4 == 0;
    if (fail) {
      client_->FailAction(steps.back().action, -1);
    }
    string txn_id;
    ASSERT_OK(coordinator_->StartSaga("", steps, &txn_id));
    txn_ids.push_back(txn_id);
    should_fail.push_back(fail);
  }

  for (int i = 0; i < kNumSagas; i++) {
    NO_FATALS(WaitForStatus(txn_ids[i], should_fail[i] ? SAGA_COMPENSATED : SAGA_COMPLETED));
    int undo_calls = client_->CallCount(absl::Substitute("a_$0_undo", i));
    ASSERT_EQ(should_fail[i] ? 1 : 0, undo_calls) << txn_ids[i];
  }
  ASSERT_EVENTUALLY([&]() {
    ASSERT_EQ(0, coordinator_->num_active_transactions());
  });
}

TEST_F(SagaCoordinatorTest, TestNotRunning) {
  SagaCoordinator coordinator(Options("coord-3"), store_.get());
  string txn_id;
  Status s = coordinator.StartSaga("", { MakeStep("a") }, &txn_id);
  ASSERT_TRUE(s.IsIllegalState()) << s.ToString();

  coordinator_->Shutdown();
  s = coordinator_->StartSaga("", { MakeStep("a") }, &txn_id);
  ASSERT_TRUE(s.IsServiceUnavailable()) << s.ToString();
  s = coordinator_->RecoverOrphanedTransactions();
  ASSERT_TRUE(s.IsServiceUnavailable()) << s.ToString();
}

} // namespace keel
