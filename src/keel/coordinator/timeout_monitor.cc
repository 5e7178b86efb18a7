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

#include "keel/coordinator/timeout_monitor.h"

#include <system_error>

#include <glog/logging.h>

#include "keel/coordinator/saga_coordinator.h"

namespace keel {

TimeoutMonitor::TimeoutMonitor(SagaCoordinator* coordinator,
                               const MonoDelta& interval,
                               const MonoDelta& error_backoff)
    : coordinator_(coordinator),
      interval_(interval),
      error_backoff_(error_backoff),
      shutdown_(1) {
}

TimeoutMonitor::~TimeoutMonitor() {
  Shutdown();
}

Status TimeoutMonitor::Init() {
  DCHECK(!thread_.joinable());
  try {
    thread_ = std::thread([this]() { this->RunLoop(); });
  } catch (const std::system_error& e) {
    return Status::RuntimeError("unable to start saga timeout monitor thread", e.what());
  }
  return Status::OK();
}

void TimeoutMonitor::Shutdown() {
  shutdown_.CountDown();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TimeoutMonitor::RunLoop() {
  MonoDelta wait = MonoDelta::FromMilliseconds(0);
  while (!shutdown_.WaitFor(wait)) {
    int num_aborted = 0;
    Status s = coordinator_->AbortTimedOutTransactions(&num_aborted);
    if (!s.ok()) {
      LOG(WARNING) << "Saga timeout pass failed, retrying in "
                   << error_backoff_.ToString() << ": " << s.ToString();
      wait = error_backoff_;
      continue;
    }
    if (num_aborted > 0) {
      LOG(INFO) << "Aborted " << num_aborted << " timed out saga transaction(s)";
    }
    wait = interval_;
  }
}

} // namespace keel
