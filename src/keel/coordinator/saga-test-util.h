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

#include <algorithm>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "keel/common/saga_types.h"
#include "keel/coordinator/service_client.h"
#include "keel/util/countdown_latch.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"

namespace keel {

// A ServiceClient for tests which records every call it serves, in order.
//
// Actions succeed by default, returning { "id": "<action>-result" }. They can
// be made to fail, to take time, or to block until released. A single client
// may be registered for several services so that the call log orders calls
// across services.
class MockServiceClient : public ServiceClient {
 public:
  struct CallRecord {
    std::string action;
    Payload payload;
    MonoTime time;
  };

  MockServiceClient() {}

  Status Call(const std::string& action,
              const Payload& payload,
              const MonoTime& deadline,
              Payload* result) override {
    Status failure;
    MonoDelta latency;
    std::shared_ptr<CountDownLatch> block;
    {
      std::lock_guard<std::mutex> l(lock_);
      calls_.push_back({ action, payload, MonoTime::Now() });
      auto f = failures_.find(action);
      if (f != failures_.end() && f->second.first != 0) {
        if (f->second.first > 0) {
          f->second.first--;
        }
        failure = f->second.second;
      }
      auto lat = latencies_.find(action);
      if (lat != latencies_.end()) {
        latency = lat->second;
      }
      auto b = blocks_.find(action);
      if (b != blocks_.end()) {
        block = b->second;
      }
      in_flight_++;
      max_in_flight_ = std::max(max_in_flight_, in_flight_);
    }
    Status s = Serve(deadline, latency, block.get());
    {
      std::lock_guard<std::mutex> l(lock_);
      in_flight_--;
    }
    RETURN_NOT_OK(s);
    RETURN_NOT_OK(failure);
    result->clear();
    (*result)["id"] = action + "-result";
    return Status::OK();
  }

  // Fails the next 'times' calls of 'action' with 's'; every call if
  // 'times' is negative.
  void FailAction(const std::string& action, int times,
                  const Status& s = Status::RemoteError("injected failure")) {
    std::lock_guard<std::mutex> l(lock_);
    failures_[action] = { times, s };
  }

  void SetLatency(const std::string& action, const MonoDelta& latency) {
    std::lock_guard<std::mutex> l(lock_);
    latencies_[action] = latency;
  }

  // Calls of 'action' block until Unblock() or their deadline.
  void BlockAction(const std::string& action) {
    std::lock_guard<std::mutex> l(lock_);
    blocks_[action] = std::make_shared<CountDownLatch>(1);
  }

  void Unblock(const std::string& action) {
    std::lock_guard<std::mutex> l(lock_);
    auto b = blocks_.find(action);
    if (b != blocks_.end()) {
      b->second->CountDown();
      blocks_.erase(b);
    }
  }

  std::vector<CallRecord> calls() const {
    std::lock_guard<std::mutex> l(lock_);
    return calls_;
  }

  // Names of the actions called, in call order.
  std::vector<std::string> actions() const {
    std::lock_guard<std::mutex> l(lock_);
    std::vector<std::string> ret;
    for (const auto& c : calls_) {
      ret.push_back(c.action);
    }
    return ret;
  }

  int CallCount(const std::string& action) const {
    std::lock_guard<std::mutex> l(lock_);
    return static_cast<int>(std::count_if(calls_.begin(), calls_.end(),
        [&](const CallRecord& c) { return c.action == action; }));
  }

  // Highest number of calls served at the same time so far.
  int max_in_flight() const {
    std::lock_guard<std::mutex> l(lock_);
    return max_in_flight_;
  }

 private:
  static Status Serve(const MonoTime& deadline, const MonoDelta& latency,
                      CountDownLatch* block) {
    if (block && !block->WaitUntil(deadline)) {
      return Status::TimedOut("blocked call reached its deadline");
    }
    if (latency.Initialized()) {
      MonoTime done = MonoTime::Now() + latency;
      if (done > deadline) {
        SleepFor(deadline - MonoTime::Now());
        return Status::TimedOut("call reached its deadline");
      }
      SleepFor(latency);
    }
    return Status::OK();
  }

  mutable std::mutex lock_;
  std::vector<CallRecord> calls_;
  std::map<std::string, std::pair<int, Status>> failures_;
  std::map<std::string, MonoDelta> latencies_;
  std::map<std::string, std::shared_ptr<CountDownLatch>> blocks_;
  int in_flight_ = 0;
  int max_in_flight_ = 0;

  DISALLOW_COPY_AND_ASSIGN(MockServiceClient);
};

} // namespace keel
