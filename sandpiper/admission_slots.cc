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

#include "./sandpiper/admission_slots.h"

#include <cstddef>

#include "absl/log/check.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "./sandpiper/cancellation.h"

namespace sandpiper {

namespace {
// Cancellation doesn't signal `mu_`, so blocked acquirers re-check it at this
// interval.
constexpr absl::Duration kCancellationPollInterval = absl::Milliseconds(5);
}  // namespace

AdmissionSlots::AdmissionSlots(size_t num_slots)
    : num_slots_(num_slots), num_free_(num_slots) {
  CHECK_GT(num_slots, 0);
}

bool AdmissionSlots::Acquire(const CancellationToken &cancellation) {
  absl::MutexLock lock(&mu_);
  while (!cancellation.IsCancelled()) {
    if (mu_.AwaitWithTimeout(
            absl::Condition(this, &AdmissionSlots::HasFreeSlot),
            kCancellationPollInterval)) {
      // A slot freed after cancellation must not admit the waiter.
      if (cancellation.IsCancelled()) break;
      --num_free_;
      return true;
    }
  }
  return false;
}

void AdmissionSlots::Release() {
  absl::MutexLock lock(&mu_);
  CHECK_LT(num_free_, num_slots_) << "Release() without a matching Acquire()";
  ++num_free_;
}

size_t AdmissionSlots::num_free() const {
  absl::MutexLock lock(&mu_);
  return num_free_;
}

}  // namespace sandpiper
