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

#include "keel/util/threadpool.h"

#include <unistd.h>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "keel/util/countdown_latch.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"
#include "keel/util/test_util.h"

using std::atomic;
using std::shared_ptr;
using std::string;
using std::unique_ptr;

namespace keel {

static const char* kDefaultPoolName = "test";

class ThreadPoolTest : public KeelTest {
 public:
  void SetUp() override {
    KeelTest::SetUp();
    ASSERT_OK(ThreadPoolBuilder(kDefaultPoolName).Build(&pool_));
  }

  Status RebuildPoolWithBuilder(const ThreadPoolBuilder& builder) {
    return builder.Build(&pool_);
  }

  Status RebuildPoolWithMinMax(int min_threads, int max_threads) {
    return ThreadPoolBuilder(kDefaultPoolName)
        .set_min_threads(min_threads)
        .set_max_threads(max_threads)
        .Build(&pool_);
  }

 protected:
  unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, TestNoTaskOpenClose) {
  ASSERT_OK(RebuildPoolWithMinMax(4, 4));
  pool_->Shutdown();
}

static void SimpleTaskMethod(int n, atomic<int32_t>* counter) {
  while (n--) {
    (*counter)++;
    std::this_thread::yield();
  }
}

class SimpleTask : public Runnable {
 public:
  SimpleTask(int n, atomic<int32_t>* counter)
      : n_(n), counter_(counter) {
  }

  void Run() override {
    SimpleTaskMethod(n_, counter_);
  }

 private:
  int n_;
  atomic<int32_t>* counter_;
};

TEST_F(ThreadPoolTest, TestSimpleTasks) {
  ASSERT_OK(RebuildPoolWithMinMax(4, 4));

  atomic<int32_t> counter(0);
  shared_ptr<Runnable> task(new SimpleTask(15, &counter));

  ASSERT_OK(pool_->SubmitFunc([&counter]() { SimpleTaskMethod(10, &counter); }));
  ASSERT_OK(pool_->Submit(task));
  ASSERT_OK(pool_->SubmitFunc([&counter]() { SimpleTaskMethod(20, &counter); }));
  ASSERT_OK(pool_->Submit(task));
  pool_->Wait();
  ASSERT_EQ(10 + 15 + 20 + 15, counter.load());
  pool_->Shutdown();
}

TEST_F(ThreadPoolTest, TestSubmitAfterShutdown) {
  ASSERT_OK(RebuildPoolWithMinMax(1, 1));
  pool_->Shutdown();
  Status s = pool_->SubmitFunc([]() {});
  ASSERT_EQ("Service unavailable: The pool has been shut down.",
            s.ToString());
}

TEST_F(ThreadPoolTest, TestThreadPoolWithNoMinimum) {
  ASSERT_OK(RebuildPoolWithMinMax(0, 3));
  // There are no threads to start with.
  ASSERT_EQ(0, pool_->num_threads());
  // We get up to 3 threads when submitting work.
  CountDownLatch latch(1);
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(2, pool_->num_threads());
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(3, pool_->num_threads());
  // The 4th piece of work gets queued.
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(3, pool_->num_threads());
  // Finish all work
  latch.CountDown();
  pool_->Wait();
  ASSERT_EQ(0, pool_->num_active_threads());
  pool_->Shutdown();
  ASSERT_EQ(0, pool_->num_threads());
}

// Regression test for a bug where a task is submitted exactly
// as a thread is about to exit. Previously this could hang forever.
TEST_F(ThreadPoolTest, TestRace) {
  alarm(60);
  ASSERT_OK(RebuildPoolWithMinMax(0, 1));

  for (int i = 0; i < 500; i++) {
    CountDownLatch l(1);
    ASSERT_OK(pool_->SubmitFunc([&l]() { l.CountDown(); }));
    l.Wait();
    // Sleeping a different amount in each iteration makes it more likely to hit
    // the bug.
    SleepFor(MonoDelta::FromMicroseconds(i));
  }
  alarm(0);
}

TEST_F(ThreadPoolTest, TestVariableSizeThreadPool) {
  ASSERT_OK(RebuildPoolWithMinMax(1, 4));
  // There is 1 thread to start with.
  ASSERT_EQ(1, pool_->num_threads());
  // We get up to 4 threads when submitting work.
  CountDownLatch latch(1);
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(1, pool_->num_threads());
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(2, pool_->num_threads());
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(3, pool_->num_threads());
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(4, pool_->num_threads());
  // The 5th piece of work gets queued.
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_EQ(4, pool_->num_threads());
  // Finish all work
  latch.CountDown();
  pool_->Wait();
  ASSERT_EQ(0, pool_->num_active_threads());
  pool_->Shutdown();
  ASSERT_EQ(0, pool_->num_threads());
}

TEST_F(ThreadPoolTest, TestMaxQueueSize) {
  ASSERT_OK(RebuildPoolWithBuilder(ThreadPoolBuilder(kDefaultPoolName)
                                   .set_min_threads(1)
                                   .set_max_threads(1)
                                   .set_max_queue_size(1)));

  CountDownLatch latch(1);
  // Make sure the latch is counted down even if one of the assertions fails.
  CountDownOnScopeExit decrement_on_exit(&latch);
  // One task runs, one is queued.
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  Status s = pool_->SubmitFunc([&latch]() { latch.Wait(); });
  ASSERT_TRUE(s.IsServiceUnavailable()) << "Expected failure due to queue blowout:"
                                        << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Thread pool is at capacity");
  latch.CountDown();
  pool_->Wait();
}

TEST_F(ThreadPoolTest, TestWaitForTimesOutWhileBusy) {
  ASSERT_OK(RebuildPoolWithMinMax(1, 1));
  CountDownLatch latch(1);
  CountDownOnScopeExit decrement_on_exit(&latch);
  ASSERT_OK(pool_->SubmitFunc([&latch]() { latch.Wait(); }));
  ASSERT_FALSE(pool_->WaitFor(MonoDelta::FromMilliseconds(50)));
  latch.CountDown();
  ASSERT_TRUE(pool_->WaitFor(MonoDelta::FromSeconds(10)));
}

// Shutdown() drops the queued tasks and waits for the running ones.
TEST_F(ThreadPoolTest, TestShutdownDropsQueuedTasks) {
  ASSERT_OK(RebuildPoolWithMinMax(1, 1));
  CountDownLatch started(1);
  CountDownLatch release(1);
  atomic<int32_t> ran(0);
  ASSERT_OK(pool_->SubmitFunc([&]() {
    started.CountDown();
    release.Wait();
    ran++;
  }));
  ASSERT_OK(pool_->SubmitFunc([&]() { ran++; }));
  started.Wait();
  std::thread releaser([&]() {
    SleepFor(MonoDelta::FromMilliseconds(50));
    release.CountDown();
  });
  pool_->Shutdown();
  releaser.join();
  ASSERT_EQ(1, ran.load());
}

} // namespace keel
