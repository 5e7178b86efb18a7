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

#include "keel/coordinator/step_invoker.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <absl/strings/substitute.h>
#include <glog/logging.h>

#include "keel/coordinator/service_client.h"
#include "keel/util/threadpool.h"

using std::shared_ptr;
using std::string;

namespace keel {

// Rendezvous between the waiting caller and the pool thread running a call.
struct StepInvoker::PendingCall {
  std::mutex lock;
  std::condition_variable cond;
  bool done = false;
  bool cancelled = false;
  Status status;
  Payload result;
};

StepInvoker::StepInvoker(ThreadPool* call_pool, const MonoDelta& retry_backoff_base)
    : call_pool_(call_pool),
      retry_backoff_base_(retry_backoff_base),
      shutting_down_(false) {
  DCHECK(call_pool_);
}

StepInvoker::~StepInvoker() {
  Shutdown();
}

Status StepInvoker::Invoke(const shared_ptr<ServiceClient>& client,
                           const string& action,
                           const Payload& payload,
                           const MonoDelta& timeout,
                           Payload* result) {
  auto call = std::make_shared<PendingCall>();
  {
    std::lock_guard<std::mutex> l(lock_);
    if (shutting_down_) {
      return Status::ServiceUnavailable("step invoker is shutting down");
    }
    pending_calls_.insert(call);
  }
  auto unregister = [&]() {
    std::lock_guard<std::mutex> l(lock_);
    pending_calls_.erase(call);
  };

  const MonoTime deadline = MonoTime::Now() + timeout;
  Status s = call_pool_->SubmitFunc([call, client, action, payload, deadline]() {
    Payload call_result;
    Status call_status = client->Call(action, payload, deadline, &call_result);
    std::lock_guard<std::mutex> l(call->lock);
    call->status = std::move(call_status);
    call->result = std::move(call_result);
    call->done = true;
    call->cond.notify_all();
  });
  if (!s.ok()) {
    unregister();
    return s.CloneAndPrepend(absl::Substitute("unable to dispatch call to $0", action));
  }

  Status ret;
  {
    std::unique_lock<std::mutex> l(call->lock);
    while (!call->done && !call->cancelled) {
      MonoDelta remaining = deadline - MonoTime::Now();
      if (remaining.ToNanoseconds() <= 0) {
        break;
      }
      call->cond.wait_for(l, std::chrono::nanoseconds(remaining.ToNanoseconds()));
    }
    if (call->done) {
      ret = call->status;
      if (ret.ok()) {
        *result = std::move(call->result);
      }
    } else if (call->cancelled) {
      ret = Status::ServiceUnavailable(
          absl::Substitute("abandoned call to $0 on shutdown", action));
    } else {
      ret = Status::TimedOut(
          absl::Substitute("$0 did not return within $1", action, timeout.ToString()));
    }
  }
  unregister();
  return ret;
}

Status StepInvoker::InvokeWithRetries(const string& log_prefix,
                                      const SagaStep& step,
                                      const shared_ptr<ServiceClient>& client,
                                      const BackoffWaiter& wait,
                                      Payload* result,
                                      int32_t* failed_attempts) {
  const MonoDelta timeout = MonoDelta::FromSeconds(step.timeout_s);
  const int max_attempts = step.retry_count + 1;
  int32_t failures = 0;
  Status s;
  for (int attempt = 0; attempt < max_attempts; attempt++) {
    s = Invoke(client, step.action, step.payload, timeout, result);
    if (s.ok()) {
      break;
    }
    failures++;
    if (attempt + 1 == max_attempts) {
      LOG(WARNING) << log_prefix << "step " << step.step_id << " failed after "
                   << max_attempts << " attempt(s): " << s.ToString();
      break;
    }
    MonoDelta delay = BackoffForAttempt(attempt);
    LOG(WARNING) << log_prefix << "step " << step.step_id << " failed (attempt "
                 << attempt + 1 << " of " << max_attempts << "), retrying in "
                 << delay.ToString() << ": " << s.ToString();
    if (!wait(delay)) {
      VLOG(1) << log_prefix << "step " << step.step_id << ": giving up retrying";
      break;
    }
  }
  *failed_attempts = failures;
  return s;
}

MonoDelta StepInvoker::BackoffForAttempt(int attempt) const {
  // Cap the exponent so that the shift can't overflow.
  int exponent = std::min(std::max(attempt, 0), 20);
  return MonoDelta::FromNanoseconds(retry_backoff_base_.ToNanoseconds() << exponent);
}

void StepInvoker::Shutdown() {
  std::lock_guard<std::mutex> l(lock_);
  if (shutting_down_) {
    return;
  }
  shutting_down_ = true;
  for (const auto& call : pending_calls_) {
    std::lock_guard<std::mutex> cl(call->lock);
    call->cancelled = true;
    call->cond.notify_all();
  }
}

} // namespace keel
