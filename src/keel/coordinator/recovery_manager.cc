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

#include "keel/coordinator/recovery_manager.h"

#include <system_error>

#include <glog/logging.h>

#include "keel/coordinator/saga_coordinator.h"

namespace keel {

RecoveryManager::RecoveryManager(SagaCoordinator* coordinator,
                                 const MonoDelta& interval,
                                 const MonoDelta& error_backoff)
    : coordinator_(coordinator),
      interval_(interval),
      error_backoff_(error_backoff),
      shutdown_(1) {
}

RecoveryManager::~RecoveryManager() {
  Shutdown();
}

Status RecoveryManager::Init() {
  DCHECK(!thread_.joinable());
  try {
    thread_ = std::thread([this]() { this->RunLoop(); });
  } catch (const std::system_error& e) {
    return Status::RuntimeError("unable to start saga recovery thread", e.what());
  }
  return Status::OK();
}

void RecoveryManager::Shutdown() {
  shutdown_.CountDown();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void RecoveryManager::RunLoop() {
  VLOG(1) << "saga recovery thread started";
  MonoDelta wait = MonoDelta::FromMilliseconds(0);
  while (!shutdown_.WaitFor(wait)) {
    int num_recovered = 0;
    Status s = coordinator_->RecoverOrphanedTransactions(&num_recovered);
    if (s.ok()) {
      if (num_recovered > 0) {
        LOG(INFO) << "Recovered " << num_recovered << " orphaned saga transaction(s)";
      }
      wait = interval_;
    } else {
      LOG(WARNING) << "Saga recovery pass failed, retrying in "
                   << error_backoff_.ToString() << ": " << s.ToString();
      wait = error_backoff_;
    }
  }
  VLOG(1) << "saga recovery thread exiting";
}

} // namespace keel
