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

#include <atomic>
#include <thread>  // NOLINT
#include <vector>

#include "gtest/gtest.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./sandpiper/cancellation.h"

namespace sandpiper {
namespace {

TEST(AdmissionSlotsTest, AcquireAndRelease) {
  CancellationToken never_cancelled;
  AdmissionSlots slots{2};
  EXPECT_EQ(slots.num_slots(), 2);
  EXPECT_EQ(slots.num_free(), 2);
  EXPECT_TRUE(slots.Acquire(never_cancelled));
  EXPECT_TRUE(slots.Acquire(never_cancelled));
  EXPECT_EQ(slots.num_free(), 0);
  slots.Release();
  EXPECT_EQ(slots.num_free(), 1);
  slots.Release();
  EXPECT_EQ(slots.num_free(), 2);
}

TEST(AdmissionSlotsTest, CancelledAcquireTakesNoSlot) {
  CancellationToken cancelled;
  cancelled.Cancel();
  AdmissionSlots slots{1};
  EXPECT_FALSE(slots.Acquire(cancelled));
  EXPECT_EQ(slots.num_free(), 1);
}

TEST(AdmissionSlotsTest, BlockedAcquireObservesCancellation) {
  CancellationToken token;
  AdmissionSlots slots{1};
  ASSERT_TRUE(slots.Acquire(token));
  std::atomic<bool> acquired = true;
  std::thread waiter([&] { acquired = slots.Acquire(token); });
  absl::SleepFor(absl::Milliseconds(50));
  token.Cancel();
  waiter.join();
  EXPECT_FALSE(acquired);
  EXPECT_EQ(slots.num_free(), 0);
  slots.Release();
}

TEST(AdmissionSlotsTest, SlotFreedAfterCancellationIsNotTaken) {
  CancellationToken token;
  AdmissionSlots slots{1};
  ASSERT_TRUE(slots.Acquire(token));
  std::atomic<bool> acquired = true;
  std::thread waiter([&] { acquired = slots.Acquire(token); });
  absl::SleepFor(absl::Milliseconds(50));
  token.Cancel();
  slots.Release();
  waiter.join();
  EXPECT_FALSE(acquired);
  EXPECT_EQ(slots.num_free(), 1);
}

TEST(AdmissionSlotsTest, NeverExceedsCapacity) {
  constexpr int kNumSlots = 3;
  constexpr int kNumWorkers = 12;
  CancellationToken token;
  AdmissionSlots slots{kNumSlots};
  std::atomic<int> active = 0;
  std::atomic<int> max_active = 0;
  std::vector<std::thread> workers;
  for (int i = 0; i < kNumWorkers; ++i) {
    workers.emplace_back([&] {
      ASSERT_TRUE(slots.Acquire(token));
      const int now_active = ++active;
      int prev_max = max_active;
      while (now_active > prev_max &&
             !max_active.compare_exchange_weak(prev_max, now_active)) {
      }
      absl::SleepFor(absl::Milliseconds(10));
      --active;
      slots.Release();
    });
  }
  for (auto &worker : workers) worker.join();
  EXPECT_LE(max_active, kNumSlots);
  EXPECT_GE(max_active, 1);
  EXPECT_EQ(slots.num_free(), kNumSlots);
}

}  // namespace
}  // namespace sandpiper
