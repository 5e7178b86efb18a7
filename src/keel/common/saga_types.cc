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

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>
#include <glog/logging.h>

using std::string;
using std::vector;

namespace keel {

const char* const kOriginalResultPrefix = "original_result.";

const char* SagaStatusToString(SagaStatus status) {
  switch (status) {
    case SagaStatus::kPending: return "PENDING";
    case SagaStatus::kRunning: return "RUNNING";
    case SagaStatus::kCompleted: return "COMPLETED";
    case SagaStatus::kFailed: return "FAILED";
    case SagaStatus::kCompensating: return "COMPENSATING";
    case SagaStatus::kCompensated: return "COMPENSATED";
  }
  LOG(FATAL) << "unknown saga status: " << static_cast<int>(status);
  return nullptr;
}

const char* StepStatusToString(StepStatus status) {
  switch (status) {
    case StepStatus::kPending: return "PENDING";
    case StepStatus::kRunning: return "RUNNING";
    case StepStatus::kCompleted: return "COMPLETED";
    case StepStatus::kFailed: return "FAILED";
    case StepStatus::kCompensating: return "COMPENSATING";
    case StepStatus::kCompensated: return "COMPENSATED";
  }
  LOG(FATAL) << "unknown step status: " << static_cast<int>(status);
  return nullptr;
}

std::ostream& operator<<(std::ostream& o, SagaStatus status) {
  return o << SagaStatusToString(status);
}

std::ostream& operator<<(std::ostream& o, StepStatus status) {
  return o << StepStatusToString(status);
}

SagaStatusPB SagaStatusToPB(SagaStatus status) {
  switch (status) {
    case SagaStatus::kPending: return SAGA_PENDING;
    case SagaStatus::kRunning: return SAGA_RUNNING;
    case SagaStatus::kCompleted: return SAGA_COMPLETED;
    case SagaStatus::kFailed: return SAGA_FAILED;
    case SagaStatus::kCompensating: return SAGA_COMPENSATING;
    case SagaStatus::kCompensated: return SAGA_COMPENSATED;
  }
  LOG(FATAL) << "unknown saga status: " << static_cast<int>(status);
  return UNKNOWN_SAGA_STATUS;
}

StepStatusPB StepStatusToPB(StepStatus status) {
  switch (status) {
    case StepStatus::kPending: return STEP_PENDING;
    case StepStatus::kRunning: return STEP_RUNNING;
    case StepStatus::kCompleted: return STEP_COMPLETED;
    case StepStatus::kFailed: return STEP_FAILED;
    case StepStatus::kCompensating: return STEP_COMPENSATING;
    case StepStatus::kCompensated: return STEP_COMPENSATED;
  }
  LOG(FATAL) << "unknown step status: " << static_cast<int>(status);
  return UNKNOWN_STEP_STATUS;
}

Status SagaStatusFromPB(SagaStatusPB pb, SagaStatus* status) {
  switch (pb) {
    case SAGA_PENDING: *status = SagaStatus::kPending; break;
    case SAGA_RUNNING: *status = SagaStatus::kRunning; break;
    case SAGA_COMPLETED: *status = SagaStatus::kCompleted; break;
    case SAGA_FAILED: *status = SagaStatus::kFailed; break;
    case SAGA_COMPENSATING: *status = SagaStatus::kCompensating; break;
    case SAGA_COMPENSATED: *status = SagaStatus::kCompensated; break;
    default:
      return Status::Corruption(
          absl::Substitute("unknown saga status: $0", static_cast<int>(pb)));
  }
  return Status::OK();
}

Status StepStatusFromPB(StepStatusPB pb, StepStatus* status) {
  switch (pb) {
    case STEP_PENDING: *status = StepStatus::kPending; break;
    case STEP_RUNNING: *status = StepStatus::kRunning; break;
    case STEP_COMPLETED: *status = StepStatus::kCompleted; break;
    case STEP_FAILED: *status = StepStatus::kFailed; break;
    case STEP_COMPENSATING: *status = StepStatus::kCompensating; break;
    case STEP_COMPENSATED: *status = StepStatus::kCompensated; break;
    default:
      return Status::Corruption(
          absl::Substitute("unknown step status: $0", static_cast<int>(pb)));
  }
  return Status::OK();
}

string SagaStep::ToString() const {
  return absl::Substitute("$0 ($1.$2, compensation $1.$3, depends on [$4])",
                          step_id, service_name, action, compensation_action,
                          absl::StrJoin(depends_on, ", "));
}

void SagaStepToPB(const SagaStep& step, SagaStepPB* pb) {
  pb->Clear();
  pb->set_step_id(step.step_id);
  pb->set_service_name(step.service_name);
  pb->set_action(step.action);
  pb->set_compensation_action(step.compensation_action);
  for (const auto& e : step.payload) {
    (*pb->mutable_payload())[e.first] = e.second;
  }
  pb->set_timeout_s(step.timeout_s);
  pb->set_retry_count(step.retry_count);
  for (const auto& dep : step.depends_on) {
    pb->add_depends_on(dep);
  }
}

Status SagaStepFromPB(const SagaStepPB& pb, SagaStep* step) {
  if (!pb.IsInitialized()) {
    return Status::Corruption("incomplete saga step", pb.InitializationErrorString());
  }
  SagaStep s;
  s.step_id = pb.step_id();
  s.service_name = pb.service_name();
  s.action = pb.action();
  s.compensation_action = pb.compensation_action();
  s.payload.insert(pb.payload().begin(), pb.payload().end());
  s.timeout_s = pb.timeout_s();
  s.retry_count = pb.retry_count();
  s.depends_on.insert(pb.depends_on().begin(), pb.depends_on().end());
  *step = std::move(s);
  return Status::OK();
}

void SagaDefinitionToPB(const vector<SagaStep>& steps, SagaDefinitionPB* pb) {
  pb->Clear();
  for (const auto& step : steps) {
    SagaStepToPB(step, pb->add_steps());
  }
}

Status SagaDefinitionFromPB(const SagaDefinitionPB& pb, vector<SagaStep>* steps) {
  vector<SagaStep> result;
  result.reserve(pb.steps_size());
  for (const auto& step_pb : pb.steps()) {
    SagaStep step;
    RETURN_NOT_OK_PREPEND(SagaStepFromPB(step_pb, &step), "invalid saga definition");
    result.emplace_back(std::move(step));
  }
  *steps = std::move(result);
  return Status::OK();
}

Payload MakeCompensationPayload(const Payload& payload, const Payload& result) {
  Payload ret = payload;
  for (const auto& e : result) {
    ret[kOriginalResultPrefix + e.first] = e.second;
  }
  return ret;
}

} // namespace keel
