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

#ifndef SANDPIPER_WORK_QUEUE_H_
#define SANDPIPER_WORK_QUEUE_H_

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace sandpiper {

// An unbounded FIFO of pending work. Any number of threads may push and pop
// concurrently. Never blocks beyond the internal lock: an empty queue makes
// `TryPop()` return immediately.
template <typename Entry>
class WorkQueue {
 public:
  WorkQueue() = default;

  WorkQueue(const WorkQueue &) = delete;
  WorkQueue &operator=(const WorkQueue &) = delete;

  void Push(Entry entry) {
    absl::MutexLock lock(&mu_);
    entries_.push_back(std::move(entry));
  }

  // Pushes all of `entries` under one lock, so they land contiguously and in
  // order.
  void PushRange(std::vector<Entry> entries) {
    absl::MutexLock lock(&mu_);
    for (auto &entry : entries) entries_.push_back(std::move(entry));
  }

  // Removes and returns the oldest entry, or nullopt if there is none.
  std::optional<Entry> TryPop() {
    absl::MutexLock lock(&mu_);
    if (entries_.empty()) return std::nullopt;
    Entry entry = std::move(entries_.front());
    entries_.pop_front();
    return entry;
  }

  size_t size() const {
    absl::MutexLock lock(&mu_);
    return entries_.size();
  }

  bool empty() const { return size() == 0; }

 private:
  mutable absl::Mutex mu_;
  std::deque<Entry> entries_ ABSL_GUARDED_BY(mu_);
};

}  // namespace sandpiper

#endif  // SANDPIPER_WORK_QUEUE_H_
