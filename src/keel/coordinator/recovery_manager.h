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

#include <thread>

#include "keel/util/countdown_latch.h"
#include "keel/util/macros.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"

namespace keel {

class SagaCoordinator;

// A SagaCoordinator background task which periodically adopts transactions
// left Running or Compensating by a coordinator that crashed or stopped, and
// resumes them. It also renews the leases of the transactions the coordinator
// drives.
//
// As a background task, the lifetime of an instance of this class must be less
// than the coordinator it belongs to.
class RecoveryManager {
 public:
  RecoveryManager(SagaCoordinator* coordinator,
                  const MonoDelta& interval,
                  const MonoDelta& error_backoff);
  ~RecoveryManager();

  // Starts the background thread. The first pass runs right away.
  Status Init() WARN_UNUSED_RESULT;

  // Stops the background thread, interrupting its wait between passes.
  // This must be called before shutting down the coordinator.
  void Shutdown();

 private:
  // Runs the main loop of the recovery thread.
  void RunLoop();

  SagaCoordinator* const coordinator_;
  const MonoDelta interval_;
  const MonoDelta error_backoff_;

  std::thread thread_;

  // Counted down on shutdown.
  CountDownLatch shutdown_;

  DISALLOW_COPY_AND_ASSIGN(RecoveryManager);
};

} // namespace keel
