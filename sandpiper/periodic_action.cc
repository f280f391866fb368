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

#include "./sandpiper/periodic_action.h"

#include <cstdint>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace sandpiper {

PeriodicAction::PeriodicAction(absl::AnyInvocable<void()> action,
                               Options options)
    : action_{std::move(action)},
      options_{options},
      thread_{[this]() { RunLoop(); }} {}

PeriodicAction::~PeriodicAction() { Stop(); }

void PeriodicAction::Stop() {
  if (!stop_.HasBeenNotified()) {
    stop_.Notify();
    // Wake the loop up if it is sleeping, so it sees `stop_` right away.
    absl::MutexLock lock{&nudge_mu_};
    nudge_ = true;
  }
  // If an invocation is active, this waits for it to finish.
  if (thread_.joinable()) thread_.join();
}

void PeriodicAction::Nudge() {
  absl::MutexLock lock{&nudge_mu_};
  nudge_ = true;
}

void PeriodicAction::RunLoop() {
  uint64_t iteration = 0;
  while (!stop_.HasBeenNotified()) {
    SleepUnlessWokenByNudge(iteration == 0 ? options_.delay
                                           : options_.interval);
    if (!stop_.HasBeenNotified()) action_();
    ++iteration;
  }
}

void PeriodicAction::SleepUnlessWokenByNudge(absl::Duration duration) {
  absl::MutexLock lock{&nudge_mu_};
  if (nudge_mu_.AwaitWithTimeout(absl::Condition{&nudge_}, duration)) {
    nudge_ = false;
  }
}

}  // namespace sandpiper
