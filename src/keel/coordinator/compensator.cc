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

#include "keel/coordinator/compensator.h"

#include <memory>
#include <string>
#include <vector>

#include <absl/strings/substitute.h>
#include <glog/logging.h>

#include "keel/common/saga_types.h"
#include "keel/coordinator/saga_coordinator.h"
#include "keel/coordinator/saga_execution.h"
#include "keel/coordinator/service_client.h"
#include "keel/coordinator/step_invoker.h"
#include "keel/util/monotime.h"

using std::shared_ptr;
using std::string;
using std::vector;

namespace keel {

Compensator::Compensator(SagaCoordinator* coordinator)
    : coordinator_(coordinator) {
}

Status Compensator::Run(const shared_ptr<SagaExecution>& exec) {
  const string prefix = coordinator_->LogPrefix(exec->txn_id());
  if (exec->status() != SagaStatus::kCompensating) {
    exec->set_status(SagaStatus::kCompensating);
    RETURN_NOT_OK(coordinator_->Checkpoint(exec.get()));
  }
  RETURN_NOT_OK(WaitForRunningSteps(exec.get(), prefix));

  // Steps which were running when compensation started are settled now, so
  // this covers every step that will ever be completed.
  const vector<string> completed = exec->completed_steps();
  LOG(INFO) << prefix << "compensating " << completed.size() << " completed step(s)";
  for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
    if (coordinator_->shutting_down()) {
      return Status::ServiceUnavailable("coordinator is shutting down");
    }
    RETURN_NOT_OK(CompensateStep(exec.get(), *it, prefix));
  }

  exec->set_status(SagaStatus::kCompensated);
  RETURN_NOT_OK(coordinator_->Checkpoint(exec.get()));
  int32_t failures = exec->compensation_failures();
  if (failures > 0) {
    LOG(WARNING) << prefix << "saga compensated, " << failures
                 << " compensation action(s) failed";
  } else {
    LOG(INFO) << prefix << "saga compensated";
  }
  return Status::OK();
}

Status Compensator::WaitForRunningSteps(SagaExecution* exec, const string& log_prefix) {
  bool logged = false;
  while (true) {
    uint64_t since = exec->change_count();
    if (!exec->HasRunningSteps()) {
      return Status::OK();
    }
    if (coordinator_->shutting_down()) {
      return Status::ServiceUnavailable("coordinator is shutting down");
    }
    if (!logged) {
      VLOG(1) << log_prefix << "waiting for running steps to finish before compensating";
      logged = true;
    }
    exec->WaitForChange(since, coordinator_->options().scheduler_poll_interval);
  }
}

Status Compensator::CompensateStep(SagaExecution* exec,
                                   const string& step_id,
                                   const string& log_prefix) {
  const StepExecution state = exec->GetStepExecution(step_id);
  if (state.status != StepStatus::kCompleted &&
      state.status != StepStatus::kCompensating) {
    VLOG(1) << log_prefix << "step " << step_id << " is " << state.status
            << ", nothing to compensate";
    return Status::OK();
  }
  const SagaStep* step = exec->FindStep(step_id);
  CHECK(step) << log_prefix << "unknown step " << step_id;

  exec->MarkStepCompensating(step_id);
  RETURN_NOT_OK(coordinator_->Checkpoint(exec));

  Status s;
  shared_ptr<ServiceClient> client = coordinator_->registry_.Lookup(step->service_name);
  if (!client) {
    s = Status::NotFound("no service client registered for service", step->service_name);
  } else {
    Payload ignored;
    s = coordinator_->invoker_->Invoke(client, step->compensation_action,
                                       MakeCompensationPayload(step->payload, state.result),
                                       MonoDelta::FromSeconds(step->timeout_s),
                                       &ignored);
  }
  if (!s.ok() && coordinator_->shutting_down()) {
    // Leave the step Compensating: the sweep is resumed after recovery.
    return s.CloneAndPrepend(absl::Substitute("compensation of step $0 interrupted", step_id));
  }
  if (s.ok()) {
    VLOG(1) << log_prefix << "compensated step " << step_id;
  } else {
    LOG(ERROR) << log_prefix << "compensation " << step->compensation_action << " of step "
               << step_id << " failed, continuing with the other steps: " << s.ToString();
  }
  exec->MarkStepCompensated(step_id, s);
  return coordinator_->Checkpoint(exec);
}

} // namespace keel
