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

#include "keel/coordinator/step_graph.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "keel/common/saga_types.h"
#include "keel/coordinator/service_client.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"

using std::set;
using std::string;
using std::vector;

namespace keel {

namespace {

class NoopClient : public ServiceClient {
 public:
  Status Call(const string& /*action*/, const Payload& /*payload*/,
              const MonoTime& /*deadline*/, Payload* /*result*/) override {
    return Status::OK();
  }
};

SagaStep MakeStep(const string& id, const set<string>& deps,
                  const string& service = "svc") {
  SagaStep step;
  step.step_id = id;
  step.service_name = service;
  step.action = id + "_do";
  step.compensation_action = id + "_undo";
  step.depends_on = deps;
  return step;
}

} // anonymous namespace

class StepGraphTest : public ::testing::Test {
 public:
  void SetUp() override {
    ASSERT_OK(registry_.Register("svc", std::make_shared<NoopClient>()));
  }

 protected:
  Status Validate(const vector<SagaStep>& steps) {
    return StepGraph::Validate(steps, registry_);
  }

  ServiceClientRegistry registry_;
};

TEST_F(StepGraphTest, TestValidDag) {
  // A diamond: b and c both depend on a, d depends on both.
  ASSERT_OK(Validate({ MakeStep("a", {}),
                       MakeStep("b", { "a" }),
                       MakeStep("c", { "a" }),
                       MakeStep("d", { "b", "c" }) }));
}

TEST_F(StepGraphTest, TestEmptySaga) {
  Status s = Validate({});
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
}

TEST_F(StepGraphTest, TestDuplicateAndEmptyIds) {
  Status s = Validate({ MakeStep("a", {}), MakeStep("a", {}) });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "duplicate step id: a");

  s = Validate({ MakeStep("", {}) });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
}

TEST_F(StepGraphTest, TestUnknownDependency) {
  Status s = Validate({ MakeStep("a", {}), MakeStep("b", { "missing" }) });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "step b depends on unknown step missing");
}

TEST_F(StepGraphTest, TestSelfDependency) {
  Status s = Validate({ MakeStep("a", { "a" }) });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "depends on itself");
}

TEST_F(StepGraphTest, TestCycle) {
  Status s = Validate({ MakeStep("a", {}),
                        MakeStep("b", { "a", "d" }),
                        MakeStep("c", { "b" }),
                        MakeStep("d", { "c" }) });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "dependency cycle among steps: b, c, d");
}

TEST_F(StepGraphTest, TestUnregisteredService) {
  Status s = Validate({ MakeStep("a", {}, "payments") });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "no service client registered for service 'payments'");
}

TEST_F(StepGraphTest, TestBadLimits) {
  SagaStep step = MakeStep("a", {});
  step.timeout_s = 0;
  Status s = Validate({ step });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "non-positive timeout");

  step.timeout_s = 1;
  step.retry_count = -1;
  s = Validate({ step });
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "negative retry count");
}

TEST_F(StepGraphTest, TestTopologicalOrder) {
  vector<string> order;
  ASSERT_OK(StepGraph::TopologicalSort({ MakeStep("payment", { "inventory" }),
                                         MakeStep("inventory", { "order" }),
                                         MakeStep("order", {}) },
                                       &order));
  ASSERT_EQ((vector<string>{ "order", "inventory", "payment" }), order);
}

TEST(TransactionIdTest, TestValidation) {
  ASSERT_OK(StepGraph::ValidateTransactionId("order-42"));
  ASSERT_OK(StepGraph::ValidateTransactionId("tenant:A_1.retry"));
  ASSERT_TRUE(StepGraph::ValidateTransactionId("").IsInvalidArgument());
  ASSERT_TRUE(StepGraph::ValidateTransactionId("..").IsInvalidArgument());
  ASSERT_TRUE(StepGraph::ValidateTransactionId("a/b").IsInvalidArgument());
  ASSERT_TRUE(StepGraph::ValidateTransactionId("with space").IsInvalidArgument());
  ASSERT_TRUE(StepGraph::ValidateTransactionId(
      string(StepGraph::kMaxTransactionIdLength + 1, 'x')).IsInvalidArgument());
  ASSERT_OK(StepGraph::ValidateTransactionId(
      string(StepGraph::kMaxTransactionIdLength, 'x')));
}

} // namespace keel
