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

// `PeriodicAction` runs a callback on its own thread at a fixed interval.
// `Nudge()` requests an extra invocation right away.
//
// Example:
//   FuzzerStats stats;
//   PeriodicAction stats_logger{
//       [&stats]() { LOG(INFO) << stats.ToString(); },
//       {.delay = absl::Seconds(5), .interval = absl::Seconds(5)},
//   };

#ifndef SANDPIPER_PERIODIC_ACTION_H_
#define SANDPIPER_PERIODIC_ACTION_H_

#include <thread>  // NOLINT(build/c++11)

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

namespace sandpiper {

class PeriodicAction {
 public:
  struct Options {
    // The delay before the first invocation. May be
    // `absl::InfiniteDuration()`, in which case only `Nudge()` starts the
    // invocations.
    absl::Duration delay = absl::ZeroDuration();
    // The time between the end of one invocation and the start of the next.
    // A nudge resets it.
    absl::Duration interval = absl::InfiniteDuration();
  };

  PeriodicAction(absl::AnyInvocable<void()> action, Options options);

  PeriodicAction(const PeriodicAction &) = delete;
  PeriodicAction &operator=(const PeriodicAction &) = delete;

  // Calls `Stop()`.
  ~PeriodicAction();

  // Stops the invocations. Blocks until an active invocation, if any,
  // finishes. Idempotent.
  void Stop();

  // Triggers an out-of-schedule invocation and returns immediately.
  void Nudge();

 private:
  void RunLoop();

  // Sleeps for up to `duration`, or until a nudge comes.
  void SleepUnlessWokenByNudge(absl::Duration duration);

  absl::AnyInvocable<void()> action_;
  const Options options_;

  // WARNING!!! The order below is important: `thread_` uses the rest.
  absl::Notification stop_;
  absl::Mutex nudge_mu_;
  bool nudge_ ABSL_GUARDED_BY(nudge_mu_) = false;
  std::thread thread_;
};

}  // namespace sandpiper

#endif  // SANDPIPER_PERIODIC_ACTION_H_
