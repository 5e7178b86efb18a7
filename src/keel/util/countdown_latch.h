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
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include <glog/logging.h>

#include "keel/util/macros.h"
#include "keel/util/monotime.h"

namespace keel {

// This is a C++ implementation of the Java CountDownLatch
// class.
// See http://docs.oracle.com/javase/6/docs/api/java/util/concurrent/CountDownLatch.html
class CountDownLatch {
 public:
  // Initialize the latch with the given initial count.
  explicit CountDownLatch(int count)
      : count_(count) {
  }

  // Decrement the count of this latch by 'amount'.
  // If the new count is less than or equal to zero, then all waiting threads
  // are woken up. If the count is already zero, this has no effect.
  //
  // Returns false if the count was already zero, true otherwise.
  bool CountDown(int amount) {
    DCHECK_GE(amount, 0);
    std::lock_guard<std::mutex> lock(lock_);
    if (count_ == 0) {
      return false;
    }

    if (amount >= count_) {
      count_ = 0;
    } else {
      count_ -= amount;
    }

    if (count_ == 0) {
      // Latch has triggered.
      cond_.notify_all();
    }
    return true;
  }

  // Decrement the count of this latch.
  // If the new count is zero, then all waiting threads are woken up.
  // If the count is already zero, this has no effect.
  bool CountDown() {
    return CountDown(1);
  }

  // Wait until the count on the latch reaches zero.
  // If the count is already zero, this returns immediately.
  void Wait() const {
    std::unique_lock<std::mutex> lock(lock_);
    cond_.wait(lock, [this] { return count_ == 0; });
  }

  // Waits for the count on the latch to reach zero, or until 'when' time is
  // reached. Returns true if the count became zero, false otherwise.
  bool WaitUntil(const MonoTime& when) const {
    const MonoDelta relative = when - MonoTime::Now();
    return WaitFor(relative);
  }

  // Waits for the count on the latch to reach zero, or until 'delta' time
  // elapses. Returns true if the count became zero, false otherwise.
  bool WaitFor(const MonoDelta& delta) const {
    std::unique_lock<std::mutex> lock(lock_);
    return cond_.wait_for(lock,
                          std::chrono::nanoseconds(std::max<int64_t>(0, delta.ToNanoseconds())),
                          [this] { return count_ == 0; });
  }

  uint64_t count() const {
    std::lock_guard<std::mutex> lock(lock_);
    return count_;
  }

 private:
  mutable std::mutex lock_;
  mutable std::condition_variable cond_;

  uint64_t count_;

  DISALLOW_COPY_AND_ASSIGN(CountDownLatch);
};

// Utility class which calls latch->CountDown() in its destructor.
class CountDownOnScopeExit {
 public:
  explicit CountDownOnScopeExit(CountDownLatch* latch) : latch_(latch) {}
  ~CountDownOnScopeExit() {
    latch_->CountDown();
  }

 private:
  DISALLOW_COPY_AND_ASSIGN(CountDownOnScopeExit);

  CountDownLatch* latch_;
};

} // namespace keel
