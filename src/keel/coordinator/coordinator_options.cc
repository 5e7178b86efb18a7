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

#include "keel/coordinator/coordinator_options.h"

#include <cstdint>
#include <cstdio>

#include <gflags/gflags.h>

DEFINE_string(saga_coordinator_id, "",
              "Identifier of this coordinator instance, recorded as the owner of "
              "the transactions it drives. A random one is generated if empty.");

DEFINE_int32(saga_default_timeout_s, 300,
             "Timeout of a saga, in seconds, if none is given when starting it.");

DEFINE_bool(saga_enable_background_tasks, true,
            "Whether to periodically recover orphaned transactions and abort "
            "timed out ones.");

DEFINE_int32(saga_recovery_interval_ms, 30 * 1000,
             "Interval between two passes looking for Running, Compensating or "
             "Failed transactions that no live coordinator drives.");

DEFINE_int32(saga_timeout_check_interval_ms, 60 * 1000,
             "Interval between two passes looking for transactions past their "
             "timeout.");

DEFINE_int32(saga_background_error_backoff_ms, 5 * 1000,
             "How long a background task waits before its next pass after a "
             "pass failed.");

DEFINE_int32(saga_background_scan_limit, 1000,
             "Maximum number of transaction records a single recovery or "
             "timeout pass looks at.");

DEFINE_int32(saga_driver_pool_max_threads, 64,
             "Maximum number of sagas whose scheduling loop or compensation "
             "runs at the same time.");

DEFINE_int32(saga_step_pool_max_threads, 32,
             "Maximum number of saga steps executing at the same time, across "
             "all sagas. Ready steps beyond this wait in a queue.");

DEFINE_int32(saga_call_pool_max_threads, 256,
             "Maximum number of outstanding service client calls, including "
             "calls abandoned after timing out.");

DEFINE_int32(saga_retry_backoff_base_ms, 1000,
             "Base of the exponential backoff between retries of a failed step: "
             "retry N waits base * 2^(N-1).");

DEFINE_int32(saga_scheduler_poll_interval_ms, 100,
             "Maximum time a saga's scheduling loop waits for a step to finish "
             "before checking its state again.");

DEFINE_int32(saga_lease_duration_ms, 90 * 1000,
             "How long a coordinator's claim over a transaction lasts unless "
             "renewed. Another coordinator may recover the transaction once the "
             "lease expired. Must be longer than the recovery interval.");

namespace {

bool ValidatePositive(const char* flagname, int32_t value) {
  if (value > 0) {
    return true;
  }
  fprintf(stderr, "--%s must be positive, got %d\n", flagname, value);
  return false;
}

} // anonymous namespace

DEFINE_validator(saga_default_timeout_s, &ValidatePositive);
DEFINE_validator(saga_recovery_interval_ms, &ValidatePositive);
DEFINE_validator(saga_timeout_check_interval_ms, &ValidatePositive);
DEFINE_validator(saga_background_error_backoff_ms, &ValidatePositive);
DEFINE_validator(saga_background_scan_limit, &ValidatePositive);
DEFINE_validator(saga_driver_pool_max_threads, &ValidatePositive);
DEFINE_validator(saga_step_pool_max_threads, &ValidatePositive);
DEFINE_validator(saga_call_pool_max_threads, &ValidatePositive);
DEFINE_validator(saga_retry_backoff_base_ms, &ValidatePositive);
DEFINE_validator(saga_scheduler_poll_interval_ms, &ValidatePositive);
DEFINE_validator(saga_lease_duration_ms, &ValidatePositive);

namespace keel {

SagaCoordinatorOptions::SagaCoordinatorOptions()
    : instance_id(FLAGS_saga_coordinator_id),
      default_saga_timeout_s(FLAGS_saga_default_timeout_s),
      enable_background_tasks(FLAGS_saga_enable_background_tasks),
      recovery_interval(MonoDelta::FromMilliseconds(FLAGS_saga_recovery_interval_ms)),
      timeout_check_interval(MonoDelta::FromMilliseconds(FLAGS_saga_timeout_check_interval_ms)),
      background_error_backoff(
          MonoDelta::FromMilliseconds(FLAGS_saga_background_error_backoff_ms)),
      background_scan_limit(FLAGS_saga_background_scan_limit),
      driver_pool_max_threads(FLAGS_saga_driver_pool_max_threads),
      step_pool_max_threads(FLAGS_saga_step_pool_max_threads),
      call_pool_max_threads(FLAGS_saga_call_pool_max_threads),
      retry_backoff_base(MonoDelta::FromMilliseconds(FLAGS_saga_retry_backoff_base_ms)),
      scheduler_poll_interval(MonoDelta::FromMilliseconds(FLAGS_saga_scheduler_poll_interval_ms)),
      lease_duration(MonoDelta::FromMilliseconds(FLAGS_saga_lease_duration_ms)) {
}

} // namespace keel
