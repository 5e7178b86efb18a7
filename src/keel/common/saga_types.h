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
//
// In-memory representations of saga definitions and statuses, and their
// conversions to and from the persisted protobuf forms.
#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "keel/common/saga.pb.h"
#include "keel/util/status.h"

namespace keel {

// Key/value arguments of a service call, and the result it returns.
typedef std::map<std::string, std::string> Payload;

constexpr int32_t kDefaultStepTimeoutSecs = 30;
constexpr int32_t kDefaultStepRetryCount = 3;

// Prefix under which the result of a step's action is handed to its
// compensation action, e.g. 'original_result.order_id'.
extern const char* const kOriginalResultPrefix;

enum class SagaStatus {
  kPending,
  kRunning,
  kCompleted,
  kFailed,
  kCompensating,
  kCompensated,
};

enum class StepStatus {
  kPending,
  kRunning,
  kCompleted,
  kFailed,
  kCompensating,
  kCompensated,
};

const char* SagaStatusToString(SagaStatus status);
const char* StepStatusToString(StepStatus status);

std::ostream& operator<<(std::ostream& o, SagaStatus status);
std::ostream& operator<<(std::ostream& o, StepStatus status);

SagaStatusPB SagaStatusToPB(SagaStatus status);
StepStatusPB StepStatusToPB(StepStatus status);

// Convert the persisted statuses back. Unknown or unset values are rejected
// with Status::Corruption.
Status SagaStatusFromPB(SagaStatusPB pb, SagaStatus* status) WARN_UNUSED_RESULT;
Status StepStatusFromPB(StepStatusPB pb, StepStatus* status) WARN_UNUSED_RESULT;

// One step of a saga definition.
struct SagaStep {
  std::string step_id;
  std::string service_name;
  std::string action;
  std::string compensation_action;
  Payload payload;
  int32_t timeout_s = kDefaultStepTimeoutSecs;
  int32_t retry_count = kDefaultStepRetryCount;
  std::set<std::string> depends_on;

  std::string ToString() const;
};

void SagaStepToPB(const SagaStep& step, SagaStepPB* pb);
Status SagaStepFromPB(const SagaStepPB& pb, SagaStep* step) WARN_UNUSED_RESULT;

void SagaDefinitionToPB(const std::vector<SagaStep>& steps, SagaDefinitionPB* pb);
Status SagaDefinitionFromPB(const SagaDefinitionPB& pb,
                            std::vector<SagaStep>* steps) WARN_UNUSED_RESULT;

// Builds the payload of a compensation call: the step's original payload plus
// every entry of the action's result, keyed with kOriginalResultPrefix.
Payload MakeCompensationPayload(const Payload& payload, const Payload& result);

} // namespace keel
