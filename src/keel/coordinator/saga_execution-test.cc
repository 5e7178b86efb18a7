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

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <google/protobuf/util/message_differencer.h>
#include <gtest/gtest.h>

#include "keel/common/saga.pb.h"
#include "keel/common/saga_types.h"
#include "keel/storage/saga_txn_store.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"

using google::protobuf::util::MessageDifferencer;
using std::map;
using std::set;
using std::string;
using std::unique_ptr;
using std::vector;

namespace keel {

class SagaExecutionTest : public ::testing::Test {
 protected:
  static SagaStep MakeStep(const string& id, const set<string>& deps) {
    SagaStep step;
    step.step_id = id;
    step.service_name = "svc";
    step.action = id + "_do";
    step.compensation_action = id + "_undo";
    step.payload = { { "key", id } };
    step.depends_on = deps;
    return step;
  }

  static unique_ptr<SagaExecution> MakeDiamond() {
    return unique_ptr<SagaExecution>(new SagaExecution(
        "txn-1",
        { MakeStep("a", {}), MakeStep("b", { "a" }), MakeStep("c", { "a" }),
          MakeStep("d", { "b", "c" }) },
        1000, 2000));
  }

  static map<string, StepStatus> StatusMap(const SagaExecution& exec) {
    map<string, StepStatus> ret;
    for (const auto& step : exec.steps()) {
      ret[step.step_id] = exec.GetStepExecution(step.step_id).status;
    }
    return ret;
  }
};

TEST_F(SagaExecutionTest, TestReadySetFollowsDependencies) {
  auto exec = MakeDiamond();
  ASSERT_EQ(SagaStatus::kPending, exec->status());
  ASSERT_TRUE(exec->TakeReadySteps(5).empty());
  exec->set_status(SagaStatus::kRunning);
  ASSERT_EQ(vector<string>{ "a" }, exec->TakeReadySteps(10));
  ASSERT_EQ(StepStatus::kRunning, exec->GetStepExecution("a").status);
  ASSERT_EQ(10, exec->GetStepExecution("a").start_time_us);

  // Nothing else is ready until 'a' completes.
  ASSERT_TRUE(exec->TakeReadySteps(11).empty());
  ASSERT_TRUE(exec->HasRunningSteps());

  exec->MarkStepCompleted("a", { { "id", "a-1" } }, 0, 20);
  ASSERT_EQ((vector<string>{ "b", "c" }), exec->TakeReadySteps(21));
  exec->MarkStepCompleted("c", {}, 0, 30);
  ASSERT_TRUE(exec->TakeReadySteps(31).empty());
  exec->MarkStepCompleted("b", {}, 1, 40);
  ASSERT_EQ(vector<string>{ "d" }, exec->TakeReadySteps(41));
  ASSERT_EQ(SagaExecution::Progress::kInProgress, exec->GetProgress());
  exec->MarkStepCompleted("d", {}, 0, 50);

  ASSERT_EQ(SagaExecution::Progress::kAllCompleted, exec->GetProgress());
  ASSERT_FALSE(exec->HasUnfinishedSteps());
  ASSERT_EQ((vector<string>{ "a", "c", "b", "d" }), exec->completed_steps());
}

TEST_F(SagaExecutionTest, TestFailureAndAbort) {
  auto exec = MakeDiamond();
  exec->set_status(SagaStatus::kRunning);
  ASSERT_EQ(vector<string>{ "a" }, exec->TakeReadySteps(10));
  exec->MarkStepFailed("a", "Remote error: boom", 3, 20);
  ASSERT_EQ(SagaExecution::Progress::kStepFailed, exec->GetProgress());
  ASSERT_EQ(vector<string>{ "a" }, exec->failed_steps());
  StepExecution a = exec->GetStepExecution("a");
  ASSERT_EQ("Remote error: boom", a.error);
  ASSERT_EQ(3, a.retries_used);

  auto exec2 = MakeDiamond();
  exec2->set_status(SagaStatus::kRunning);
  exec2->RequestAbort("cancelled");
  exec2->RequestAbort("timed out");
  ASSERT_TRUE(exec2->abort_requested());
  ASSERT_EQ("cancelled", exec2->abort_reason());
  // Nothing is dispatched once an abort was requested.
  ASSERT_TRUE(exec2->TakeReadySteps(10).empty());
}

TEST_F(SagaExecutionTest, TestReleaseStepIfHalted) {
  auto exec = MakeDiamond();
  exec->set_status(SagaStatus::kRunning);
  exec->TakeReadySteps(10);
  exec->MarkStepCompleted("a", {}, 0, 20);
  ASSERT_EQ((vector<string>{ "b", "c" }), exec->TakeReadySteps(21));

  // Still running: the steps keep their slot.
  ASSERT_FALSE(exec->ReleaseStepIfHalted("c"));
  ASSERT_EQ(StepStatus::kRunning, exec->GetStepExecution("c").status);

  // Once a sibling failed, a step that didn't call its action yet goes back
  // to Pending and nothing more is dispatched.
  exec->MarkStepFailed("b", "Remote error: boom", 0, 30);
  ASSERT_TRUE(exec->ReleaseStepIfHalted("c"));
  StepExecution c = exec->GetStepExecution("c");
  ASSERT_EQ(StepStatus::kPending, c.status);
  ASSERT_EQ(0, c.start_time_us);
  ASSERT_TRUE(exec->TakeReadySteps(31).empty());
  ASSERT_FALSE(exec->HasRunningSteps());

  // Same after a cancel.
  auto exec2 = MakeDiamond();
  exec2->set_status(SagaStatus::kRunning);
  exec2->TakeReadySteps(10);
  ASSERT_TRUE(exec2->TransitionStatus(SagaStatus::kRunning, SagaStatus::kCompensating));
  ASSERT_TRUE(exec2->ReleaseStepIfHalted("a"));
  ASSERT_EQ(StepStatus::kPending, exec2->GetStepExecution("a").status);
  // Only a Running step can be released.
  ASSERT_FALSE(exec2->ReleaseStepIfHalted("a"));
}

TEST_F(SagaExecutionTest, TestTransitionStatus) {
  auto exec = MakeDiamond();
  ASSERT_FALSE(exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kCompensating));
  exec->set_status(SagaStatus::kRunning);
  ASSERT_TRUE(exec->TransitionStatus(SagaStatus::kRunning, SagaStatus::kCompensating));
  ASSERT_EQ(SagaStatus::kCompensating, exec->status());
}

TEST_F(SagaExecutionTest, TestWaitForChange) {
  auto exec = MakeDiamond();
  exec->set_status(SagaStatus::kRunning);
  uint64_t since = exec->change_count();
  ASSERT_FALSE(exec->WaitForChange(since, MonoDelta::FromMilliseconds(10)));
  exec->TakeReadySteps(10);
  ASSERT_TRUE(exec->WaitForChange(since, MonoDelta::FromMilliseconds(10)));
}

// Deserializing a just-serialized execution state reproduces it.
TEST_F(SagaExecutionTest, TestSerializationIsIdempotent) {
  auto exec = MakeDiamond();
  exec->set_status(SagaStatus::kRunning);
  exec->TakeReadySteps(10);
  exec->MarkStepCompleted("a", { { "id", "a-1" } }, 1, 20);
  exec->TakeReadySteps(21);
  exec->MarkStepFailed("c", "Timed out: c_do", 2, 30);

  SagaTxnRecordPB record;
  exec->ToRecordPB(&record);
  unique_ptr<SagaExecution> restored;
  ASSERT_OK(SagaExecution::FromRecord(record, &restored));
  ASSERT_EQ(StatusMap(*exec), StatusMap(*restored));
  ASSERT_EQ(exec->completed_steps(), restored->completed_steps());
  ASSERT_EQ(exec->failed_steps(), restored->failed_steps());
  ASSERT_EQ("a-1", restored->GetStepExecution("a").result.at("id"));
  ASSERT_EQ(2000, restored->timeout_at_us());

  SagaTxnRecordPB record2;
  restored->ToRecordPB(&record2);
  ASSERT_TRUE(MessageDifferencer::Equals(record, record2))
      << record.DebugString() << " vs " << record2.DebugString();
}

TEST_F(SagaExecutionTest, TestPrepareForRecovery) {
  auto exec = MakeDiamond();
  exec->set_status(SagaStatus::kRunning);
  exec->TakeReadySteps(10);
  exec->MarkStepCompleted("a", {}, 0, 20);
  exec->TakeReadySteps(21);
  exec->MarkStepCompleted("b", {}, 0, 30);

  SagaTxnRecordPB record;
  exec->ToRecordPB(&record);
  unique_ptr<SagaExecution> restored;
  ASSERT_OK(SagaExecution::FromRecord(record, &restored));
  ASSERT_EQ(StepStatus::kRunning, restored->GetStepExecution("c").status);
  restored->PrepareForRecovery();
  ASSERT_EQ(1, restored->recovery_count());

  // 'c' is invoked again; completed steps are not.
  ASSERT_EQ(StepStatus::kPending, restored->GetStepExecution("c").status);
  ASSERT_EQ(StepStatus::kCompleted, restored->GetStepExecution("a").status);
  ASSERT_EQ(vector<string>{ "c" }, restored->TakeReadySteps(40));
}

TEST_F(SagaExecutionTest, TestCorruptRecordsAreRejected) {
  auto exec = MakeDiamond();
  SagaTxnRecordPB good;
  exec->ToRecordPB(&good);
  unique_ptr<SagaExecution> restored;

  {
    SagaTxnRecordPB record = good;
    // Values this version doesn't know are parsed as unknown fields, which
    // leaves the status unset.
    record.clear_status();
    Status s = SagaExecution::FromRecord(record, &restored);
    ASSERT_TRUE(s.IsCorruption()) << s.ToString();
    ASSERT_STR_CONTAINS(s.ToString(), "unknown saga status: 0");
  }
  {
    SagaTxnRecordPB record = good;
    record.mutable_execution_log()->mutable_steps(1)->clear_status();
    Status s = SagaExecution::FromRecord(record, &restored);
    ASSERT_TRUE(s.IsCorruption()) << s.ToString();
    ASSERT_STR_CONTAINS(s.ToString(), "unknown step status");
  }
  {
    SagaTxnRecordPB record = good;
    record.mutable_execution_log()->mutable_steps()->RemoveLast();
    Status s = SagaExecution::FromRecord(record, &restored);
    ASSERT_TRUE(s.IsCorruption()) << s.ToString();
    ASSERT_STR_CONTAINS(s.ToString(), "no state for step d");
  }
  {
    SagaTxnRecordPB record = good;
    record.mutable_execution_log()->add_completed_steps("zzz");
    Status s = SagaExecution::FromRecord(record, &restored);
    ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  }
}

TEST_F(SagaExecutionTest, TestCheckpointWritesLease) {
  auto exec = MakeDiamond();
  exec->set_status(SagaStatus::kRunning);
  InMemorySagaTxnStore store;
  ASSERT_OK(exec->Checkpoint(&store, "coord-1", 12345));
  SagaTxnRecordPB record;
  ASSERT_OK(store.Get("txn-1", &record));
  ASSERT_EQ(SAGA_RUNNING, record.status());
  ASSERT_EQ("coord-1", record.owner_id());
  ASSERT_EQ(12345, record.lease_expires_at_us());
  ASSERT_GT(record.updated_at_us(), 0);
  ASSERT_EQ(4, record.execution_log().steps_size());
}

} // namespace keel
