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

#include "keel/common/saga_types.h"

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "keel/common/saga.pb.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"

using std::string;
using std::vector;

namespace keel {

TEST(SagaTypesTest, TestStatusRoundTrip) {
  for (SagaStatus s : { SagaStatus::kPending, SagaStatus::kRunning,
                        SagaStatus::kCompleted, SagaStatus::kFailed,
                        SagaStatus::kCompensating, SagaStatus::kCompensated }) {
    SagaStatus parsed;
    ASSERT_OK(SagaStatusFromPB(SagaStatusToPB(s), &parsed));
    ASSERT_EQ(s, parsed);
  }
  StepStatus parsed;
  ASSERT_OK(StepStatusFromPB(STEP_COMPENSATING, &parsed));
  ASSERT_EQ(StepStatus::kCompensating, parsed);
}

TEST(SagaTypesTest, TestUnknownStatusIsRejected) {
  SagaStatus saga_status;
  Status s = SagaStatusFromPB(UNKNOWN_SAGA_STATUS, &saga_status);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unknown saga status");

  // A value that is not part of the enum at all, e.g. written by a newer
  // version.
  s = SagaStatusFromPB(static_cast<SagaStatusPB>(42), &saga_status);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();

  StepStatus step_status;
  s = StepStatusFromPB(static_cast<StepStatusPB>(-1), &step_status);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
}

TEST(SagaTypesTest, TestStatusNames) {
  std::ostringstream os;
  os << SagaStatus::kCompensating << "/" << StepStatus::kFailed;
  ASSERT_EQ("COMPENSATING/FAILED", os.str());
}

TEST(SagaTypesTest, TestStepDefaults) {
  SagaStepPB pb;
  pb.set_step_id("create_order");
  pb.set_service_name("orders");
  pb.set_action("create");
  pb.set_compensation_action("cancel");
  SagaStep step;
  ASSERT_OK(SagaStepFromPB(pb, &step));
  ASSERT_EQ(kDefaultStepTimeoutSecs, step.timeout_s);
  ASSERT_EQ(kDefaultStepRetryCount, step.retry_count);
  ASSERT_TRUE(step.depends_on.empty());
}

TEST(SagaTypesTest, TestIncompleteStepIsCorruption) {
  SagaStepPB pb;
  pb.set_step_id("create_order");
  SagaStep step;
  Status s = SagaStepFromPB(pb, &step);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "service_name");
}

TEST(SagaTypesTest, TestDefinitionConversion) {
  SagaStep a;
  a.step_id = "create_order";
  a.service_name = "orders";
  a.action = "create";
  a.compensation_action = "cancel";
  a.payload = { { "user", "u1" }, { "amount", "10" } };
  SagaStep b = a;
  b.step_id = "reserve_inventory";
  b.service_name = "inventory";
  b.timeout_s = 5;
  b.retry_count = 0;
  b.depends_on = { "create_order" };

  SagaDefinitionPB pb;
  SagaDefinitionToPB({ a, b }, &pb);
  ASSERT_EQ(2, pb.steps_size());

  vector<SagaStep> steps;
  ASSERT_OK(SagaDefinitionFromPB(pb, &steps));
  ASSERT_EQ(2, steps.size());
  ASSERT_EQ("reserve_inventory", steps[1].step_id);
  ASSERT_EQ(a.payload, steps[1].payload);
  ASSERT_EQ(5, steps[1].timeout_s);
  ASSERT_EQ(0, steps[1].retry_count);
  ASSERT_EQ(b.depends_on, steps[1].depends_on);
}

TEST(SagaTypesTest, TestCompensationPayload) {
  Payload payload = { { "order_id", "o-1" } };
  Payload result = { { "reservation", "r-7" }, { "order_id", "o-1" } };
  Payload comp = MakeCompensationPayload(payload, result);
  ASSERT_EQ(3, comp.size());
  ASSERT_EQ("o-1", comp["order_id"]);
  ASSERT_EQ("r-7", comp["original_result.reservation"]);
  ASSERT_EQ("o-1", comp["original_result.order_id"]);
}

} // namespace keel
