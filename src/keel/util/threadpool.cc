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

#include <pthread.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <system_error>
#include <utility>

#include <absl/strings/substitute.h>
#include <glog/logging.h>

using std::shared_ptr;
using std::string;
using std::unique_ptr;

namespace keel {

namespace {

class FunctionRunnable : public Runnable {
 public:
  explicit FunctionRunnable(std::function<void()> func)
      : func_(std::move(func)) {
  }

  void Run() override {
    func_();
  }

 private:
  std::function<void()> func_;
};

} // anonymous namespace

////////////////////////////////////////////////////////
// ThreadPoolBuilder
////////////////////////////////////////////////////////

ThreadPoolBuilder::ThreadPoolBuilder(string name)
    : name_(std::move(name)),
      min_threads_(0),
      max_threads_(static_cast<int>(std::thread::hardware_concurrency())),
      max_queue_size_(INT_MAX) {
  if (max_threads_ <= 0) {
    max_threads_ = 1;
  }
}

ThreadPoolBuilder& ThreadPoolBuilder::set_min_threads(int min_threads) {
  CHECK_GE(min_threads, 0);
  min_threads_ = min_threads;
  return *this;
}

ThreadPoolBuilder& ThreadPoolBuilder::set_max_threads(int max_threads) {
  CHECK_GT(max_threads, 0);
  max_threads_ = max_threads;
  return *this;
}

ThreadPoolBuilder& ThreadPoolBuilder::set_max_queue_size(int max_queue_size) {
  CHECK_GT(max_queue_size, 0);
  max_queue_size_ = max_queue_size;
  return *this;
}

Status ThreadPoolBuilder::Build(unique_ptr<ThreadPool>* pool) const {
  unique_ptr<ThreadPool> new_pool(new ThreadPool(*this));
  RETURN_NOT_OK(new_pool->Init());
  *pool = std::move(new_pool);
  return Status::OK();
}

////////////////////////////////////////////////////////
// ThreadPool
////////////////////////////////////////////////////////

ThreadPool::ThreadPool(const ThreadPoolBuilder& builder)
    : name_(builder.name_),
      min_threads_(builder.min_threads_),
      max_threads_(builder.max_threads_),
      max_queue_size_(builder.max_queue_size_),
      pool_status_(Status::Uninitialized("The pool was not initialized.")),
      active_threads_(0) {
  CHECK_LE(min_threads_, max_threads_);
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

Status ThreadPool::Init() {
  std::lock_guard<std::mutex> l(lock_);
  if (!pool_status_.IsUninitialized()) {
    return Status::NotSupported("The thread pool is already initialized");
  }
  pool_status_ = Status::OK();
  for (int i = 0; i < min_threads_; i++) {
    RETURN_NOT_OK(CreateThreadUnlocked());
  }
  return Status::OK();
}

void ThreadPool::Shutdown() {
  std::vector<std::thread> to_join;
  {
    std::lock_guard<std::mutex> l(lock_);
    if (pool_status_.IsServiceUnavailable() && threads_.empty()) {
      return;
    }
    pool_status_ = Status::ServiceUnavailable("The pool has been shut down.");
    queue_.clear();
    queue_changed_.notify_all();
    idle_cond_.notify_all();
    to_join.swap(threads_);
  }

  // The Runnable doesn't have Abort() so we must wait
  // and hopefully the abort is done outside before calling Shutdown().
  for (auto& t : to_join) {
    CHECK(t.get_id() != std::this_thread::get_id())
        << "thread pool " << name_ << " shut down from one of its own workers";
    t.join();
  }
}

Status ThreadPool::SubmitFunc(std::function<void()> func) {
  return Submit(std::make_shared<FunctionRunnable>(std::move(func)));
}

Status ThreadPool::Submit(shared_ptr<Runnable> r) {
  std::lock_guard<std::mutex> l(lock_);
  if (PREDICT_FALSE(!pool_status_.ok())) {
    return pool_status_;
  }

  int64_t capacity_remaining = static_cast<int64_t>(max_threads_) - active_threads_ +
      max_queue_size_ - static_cast<int64_t>(queue_.size());
  if (capacity_remaining < 1) {
    return Status::ServiceUnavailable(
        absl::Substitute("Thread pool is at capacity ($0/$1 tasks running, $2/$3 tasks queued)",
                         active_threads_, max_threads_, queue_.size(), max_queue_size_));
  }

  // Should we create another thread?
  // We assume that each current inactive thread will grab one item from the
  // queue.  If it seems like we'll need another thread, we create one.
  // In theory, a currently active thread could finish immediately after this
  // calculation.  This would mean we created a thread we didn't really need.
  // However, this race is unavoidable, since we don't do the work under a lock.
  // It's also harmless.
  //
  // Of course, we never create more than max_threads_ threads no matter what.
  int inactive_threads = static_cast<int>(threads_.size()) - active_threads_;
  int additional_threads = static_cast<int>(queue_.size()) + 1 - inactive_threads;
  if (additional_threads > 0 && static_cast<int>(threads_.size()) < max_threads_) {
    Status status = CreateThreadUnlocked();
    if (!status.ok()) {
      if (threads_.empty()) {
        // If we have no threads, we can't do any work.
        return status;
      }
      // If we failed to create a thread, but there are still some other
      // worker threads, log a warning message and continue.
      LOG(WARNING) << "Thread pool " << name_ << " failed to create thread: "
                   << status.ToString();
    }
  }

  queue_.emplace_back(std::move(r));
  queue_changed_.notify_one();
  return Status::OK();
}

void ThreadPool::Wait() {
  std::unique_lock<std::mutex> l(lock_);
  idle_cond_.wait(l, [this] { return queue_.empty() && active_threads_ == 0; });
}

bool ThreadPool::WaitUntil(const MonoTime& until) {
  return WaitFor(until - MonoTime::Now());
}

bool ThreadPool::WaitFor(const MonoDelta& delta) {
  std::unique_lock<std::mutex> l(lock_);
  return idle_cond_.wait_for(
      l, std::chrono::nanoseconds(std::max<int64_t>(0, delta.ToNanoseconds())),
      [this] { return queue_.empty() && active_threads_ == 0; });
}

void ThreadPool::DispatchThread() {
  std::unique_lock<std::mutex> l(lock_);
  while (true) {
    // Note: Status::ServiceUnavailable() is used to indicate normal shutdown.
    if (!pool_status_.ok()) {
      VLOG(2) << "DispatchThread exiting: " << pool_status_.ToString();
      break;
    }

    if (queue_.empty()) {
      queue_changed_.wait(l);
      continue;
    }

    // Fetch a pending task
    shared_ptr<Runnable> task = std::move(queue_.front());
    queue_.pop_front();
    ++active_threads_;

    l.unlock();
    task->Run();
    // Destruct the task while we do not hold the lock.
    task.reset();
    l.lock();

    if (--active_threads_ == 0 && queue_.empty()) {
      idle_cond_.notify_all();
    }
  }
}

Status ThreadPool::CreateThreadUnlocked() {
  try {
    threads_.emplace_back([this]() { this->DispatchThread(); });
  } catch (const std::system_error& e) {
    return Status::RuntimeError(
        absl::Substitute("unable to start thread for pool $0", name_), e.what());
  }
  // Thread names are limited to 16 characters including the terminator.
  string thread_name = name_.substr(0, 15);
  pthread_setname_np(threads_.back().native_handle(), thread_name.c_str());
  return Status::OK();
}

} // namespace keel
