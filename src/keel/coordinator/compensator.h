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

#include <memory>
#include <string>

#include "keel/util/macros.h"
#include "keel/util/status.h"

namespace keel {

class SagaCoordinator;
class SagaExecution;

// Unwinds sagas that can't complete: runs the compensation action of every
// completed step, in reverse completion order.
//
// Compensation is best effort. A failed compensation action is logged and
// recorded in the execution log of the saga, and the sweep goes on with the
// next step; it is not retried. The saga ends Compensated in any case.
class Compensator {
 public:
  // 'coordinator' must outlive the compensator.
  explicit Compensator(SagaCoordinator* coordinator);

  // Moves 'exec' to Compensating, waits for its running steps to finish, and
  // compensates its completed steps. Steps left Compensating by an
  // interrupted sweep are compensated again, so resuming a sweep after
  // recovery is safe.
  //
  // Returns an error, leaving the saga Compensating, if a checkpoint fails or
  // the coordinator shuts down in the middle of the sweep.
  Status Run(const std::shared_ptr<SagaExecution>& exec) WARN_UNUSED_RESULT;

 private:
  // Waits until no step of 'exec' is Running.
  Status WaitForRunningSteps(SagaExecution* exec, const std::string& log_prefix);

  Status CompensateStep(SagaExecution* exec,
                        const std::string& step_id,
                        const std::string& log_prefix);

  SagaCoordinator* const coordinator_;

  DISALLOW_COPY_AND_ASSIGN(Compensator);
};

} // namespace keel
