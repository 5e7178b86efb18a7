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
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "keel/common/saga_types.h"
#include "keel/util/macros.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"

namespace keel {

class ServiceClient;
class ThreadPool;

// Invokes service client actions on behalf of saga steps.
//
// Each call runs on the call pool so that the caller can stop waiting for it
// once its timeout expires. A call that times out is abandoned: it keeps its
// pool thread until the client returns, and its result is discarded.
class StepInvoker {
 public:
  // Waits for 'delay' before a retry. Returns false if the step must not be
  // retried anymore, e.g. because its saga is being aborted.
  typedef std::function<bool(const MonoDelta& delay)> BackoffWaiter;

  // 'call_pool' must outlive the invoker.
  StepInvoker(ThreadPool* call_pool, const MonoDelta& retry_backoff_base);
  ~StepInvoker();

  // Invokes 'action' once. Returns the client's status, or Status::TimedOut
  // if the client did not return within 'timeout', or
  // Status::ServiceUnavailable if the invoker was shut down meanwhile.
  Status Invoke(const std::shared_ptr<ServiceClient>& client,
                const std::string& action,
                const Payload& payload,
                const MonoDelta& timeout,
                Payload* result);

  // Invokes the action of 'step', retrying up to 'step.retry_count' times
  // with exponential backoff. 'failed_attempts' is set to the number of
  // attempts that failed. Returns the status of the last attempt.
  Status InvokeWithRetries(const std::string& log_prefix,
                           const SagaStep& step,
                           const std::shared_ptr<ServiceClient>& client,
                           const BackoffWaiter& wait,
                           Payload* result,
                           int32_t* failed_attempts);

  // The delay before retrying after the given (0-based) failed attempt:
  // base * 2^attempt.
  MonoDelta BackoffForAttempt(int attempt) const;

  // Wakes up every pending Invoke() and fails the later ones.
  void Shutdown();

 private:
  struct PendingCall;

  ThreadPool* const call_pool_;
  const MonoDelta retry_backoff_base_;

  std::mutex lock_;
  bool shutting_down_;
  std::set<std::shared_ptr<PendingCall>> pending_calls_;

  DISALLOW_COPY_AND_ASSIGN(StepInvoker);
};

} // namespace keel
