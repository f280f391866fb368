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

#ifndef SANDPIPER_CANCELLATION_H_
#define SANDPIPER_CANCELLATION_H_

#include <atomic>

#include "absl/time/time.h"

namespace sandpiper {

// A one-way flag used to cooperatively wind down a fuzzing run.
// All methods are thread-safe; `Cancel()` is also async-signal-safe, so the
// token may be cancelled from a signal handler.
class CancellationToken {
 public:
  CancellationToken() = default;

  // Non-copyable and non-movable: workers hold references to it.
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  // Requests cancellation. Idempotent.
  void Cancel() { cancelled_.store(true, std::memory_order_release); }

  // Returns true iff `Cancel()` was called since construction or the most
  // recent `Reset()`.
  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Sleeps until cancelled or until `timeout` elapses, whichever comes
  // first. Returns `IsCancelled()`.
  bool WaitForCancellation(absl::Duration timeout) const;

  // Clears a previous cancellation request. Must not race with users of the
  // token: call it only before handing the token to a new run.
  void Reset() { cancelled_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool> cancelled_ = false;
};

}  // namespace sandpiper

#endif  // SANDPIPER_CANCELLATION_H_
