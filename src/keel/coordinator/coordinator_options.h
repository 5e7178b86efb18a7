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

#include <cstdint>
#include <string>

#include "keel/util/monotime.h"

namespace keel {

// Options for constructing a SagaCoordinator.
// These are filled in by gflags by default -- see the .cc file for
// the list of options and corresponding flags.
struct SagaCoordinatorOptions {
  SagaCoordinatorOptions();

  // Identifies this coordinator instance as the owner of the transactions it
  // drives. Generated by the coordinator if empty.
  std::string instance_id;

  // Saga timeout used when StartSaga() is not given one.
  int32_t default_saga_timeout_s;

  // Whether to run the recovery and timeout passes on background threads.
  // Tests turn this off and run the passes by hand.
  bool enable_background_tasks;
  MonoDelta recovery_interval;
  MonoDelta timeout_check_interval;
  MonoDelta background_error_backoff;
  int background_scan_limit;

  int driver_pool_max_threads;
  int step_pool_max_threads;
  int call_pool_max_threads;

  MonoDelta retry_backoff_base;
  MonoDelta scheduler_poll_interval;
  MonoDelta lease_duration;
};

} // namespace keel
