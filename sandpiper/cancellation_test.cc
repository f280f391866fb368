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

#include <thread>  // NOLINT

#include "gtest/gtest.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace sandpiper {
namespace {

TEST(CancellationTokenTest, StartsUncancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.IsCancelled());
}

TEST(CancellationTokenTest, CancelIsSticky) {
  CancellationToken token;
  token.Cancel();
  EXPECT_TRUE(token.IsCancelled());
  token.Cancel();
  EXPECT_TRUE(token.IsCancelled());
}

TEST(CancellationTokenTest, ResetClearsCancellation) {
  CancellationToken token;
  token.Cancel();
  token.Reset();
  EXPECT_FALSE(token.IsCancelled());
}

TEST(CancellationTokenTest, WaitTimesOutWhenNotCancelled) {
  CancellationToken token;
  const absl::Time start = absl::Now();
  EXPECT_FALSE(token.WaitForCancellation(absl::Milliseconds(50)));
  EXPECT_GE(absl::Now() - start, absl::Milliseconds(50));
}

TEST(CancellationTokenTest, WaitReturnsEarlyOnCancel) {
  CancellationToken token;
  std::thread canceller([&token] {
    absl::SleepFor(absl::Milliseconds(20));
    token.Cancel();
  });
  const absl::Time start = absl::Now();
  EXPECT_TRUE(token.WaitForCancellation(absl::Seconds(30)));
  EXPECT_LT(absl::Now() - start, absl::Seconds(10));
  canceller.join();
}

}  // namespace
}  // namespace sandpiper
