// Copyright 2024 The Sandpiper Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SANDPIPER_THREAD_POOL_H_
#define SANDPIPER_THREAD_POOL_H_

#include <cstddef>
#include <queue>
#include <thread>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/log/check.h"
#include "absl/synchronization/mutex.h"

namespace sandpiper {

// A fixed-size pool of worker threads draining a FIFO of closures.
// `Schedule()` is thread-safe and never blocks on the closures themselves.
// The destructor runs every closure scheduled so far to completion, then
// joins the threads.
class ThreadPool {
 public:
  explicit ThreadPool(size_t num_threads) {
    CHECK_GT(num_threads, 0);
    threads_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
      threads_.emplace_back(&ThreadPool::WorkLoop, this);
    }
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  ~ThreadPool() {
    {
      absl::MutexLock lock(&mu_);
      // One shutdown marker per thread, queued behind the pending work.
      for (size_t i = 0; i < threads_.size(); ++i) {
        queue_.push(nullptr);
      }
    }
    for (auto &thread : threads_) thread.join();
  }

  // Queues `func` to run on one of the worker threads.
  void Schedule(absl::AnyInvocable<void()> func) {
    CHECK(func != nullptr);
    absl::MutexLock lock(&mu_);
    queue_.push(std::move(func));
  }

  size_t num_threads() const { return threads_.size(); }

 private:
  bool WorkAvailable() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    return !queue_.empty();
  }

  void WorkLoop() {
    while (true) {
      absl::AnyInvocable<void()> func;
      {
        absl::MutexLock lock(&mu_);
        mu_.Await(absl::Condition(this, &ThreadPool::WorkAvailable));
        func = std::move(queue_.front());
        queue_.pop();
      }
      if (func == nullptr) return;
      func();
    }
  }

  absl::Mutex mu_;
  std::queue<absl::AnyInvocable<void()>> queue_ ABSL_GUARDED_BY(mu_);
  std::vector<std::thread> threads_;
};

}  // namespace sandpiper

#endif  // SANDPIPER_THREAD_POOL_H_
