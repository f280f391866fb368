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

#ifndef SANDPIPER_ADMISSION_SLOTS_H_
#define SANDPIPER_ADMISSION_SLOTS_H_

#include <cstddef>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "./sandpiper/cancellation.h"

namespace sandpiper {

// A counting semaphore bounding how many entries are processed concurrently.
// Thread-safe.
class AdmissionSlots {
 public:
  // `num_slots` must be positive.
  explicit AdmissionSlots(size_t num_slots);

  AdmissionSlots(const AdmissionSlots &) = delete;
  AdmissionSlots &operator=(const AdmissionSlots &) = delete;

  // Blocks until a slot is free or `cancellation` is cancelled. Returns true
  // iff a slot was taken, in which case the caller must `Release()` it. Once
  // `cancellation` is cancelled, never takes a slot, even a free one.
  bool Acquire(const CancellationToken &cancellation);

  // Returns a slot taken by a successful `Acquire()`.
  void Release();

  size_t num_free() const;
  size_t num_slots() const { return num_slots_; }

 private:
  bool HasFreeSlot() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    return num_free_ > 0;
  }

  const size_t num_slots_;
  mutable absl::Mutex mu_;
  size_t num_free_ ABSL_GUARDED_BY(mu_);
};

}  // namespace sandpiper

#endif  // SANDPIPER_ADMISSION_SLOTS_H_
