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

#include "./sandpiper/cancellation.h"

#include <algorithm>

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace sandpiper {

namespace {
// `Cancel()` must stay async-signal-safe, so it can't wake up a waiter through
// a mutex or a condition variable. Waiters poll at this granularity instead.
constexpr absl::Duration kPollInterval = absl::Milliseconds(1);
}  // namespace

bool CancellationToken::WaitForCancellation(absl::Duration timeout) const {
  const absl::Time deadline = absl::Now() + timeout;
  while (!IsCancelled()) {
    const absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) break;
    absl::SleepFor(std::min(remaining, kPollInterval));
  }
  return IsCancelled();
}

}  // namespace sandpiper
