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

// A SagaCoordinator background task which periodically looks for Pending or
// Running transactions past their timeout, marks them Failed and starts their
// compensation. The timeout is thus enforced with the precision of the
// polling interval.
//
// As a background task, the lifetime of an instance of this class must be less
// than the coordinator it belongs to.
class TimeoutMonitor {
 public:
  TimeoutMonitor(SagaCoordinator* coordinator,
                 const MonoDelta& interval,
                 const MonoDelta& error_backoff);
  ~TimeoutMonitor();

  // Starts the background thread. The first pass runs right away.
  Status Init() WARN_UNUSED_RESULT;

  // Stops the background thread, interrupting its wait between passes.
  // This must be called before shutting down the coordinator.
  void Shutdown();

 private:
  void RunLoop();

  SagaCoordinator* const coordinator_;
  const MonoDelta interval_;
  const MonoDelta error_backoff_;

  std::thread thread_;
  CountDownLatch shutdown_;

  DISALLOW_COPY_AND_ASSIGN(TimeoutMonitor);
};

} // namespace keel
