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

#include "./sandpiper/tracer.h"

#include <atomic>
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/types/span.h"
#include "./sandpiper/fault.h"

namespace sandpiper {
namespace {

using ::testing::ElementsAre;
using ::testing::InSequence;

class MockTracer : public Tracer<std::string, int> {
 public:
  MOCK_METHOD(void, InputsEnqueued, (absl::Span<const std::string> inputs),
              (override));
  MOCK_METHOD(void, InputFaulted,
              (const std::string &input, const FaultResult &fault),
              (override));
  MOCK_METHOD(void, InputFuzzed, (const std::string &input, const int &coverage),
              (override));
  MOCK_METHOD(void, FuzzerFinished, (), (override));
};

TEST(TracerTest, DefaultTracerIgnoresEverything) {
  Tracer<std::string, int> tracer;
  const std::vector<std::string> inputs = {"a"};
  tracer.InputsEnqueued(inputs);
  tracer.InputDequeued("a");
  tracer.InputFaulted("a", FaultResult::Fault("x"));
  tracer.InputFuzzed("a", 1);
  tracer.MinimizationFound("a", "");
  tracer.MutationFound("a", "b");
  tracer.FuzzerFinished();
}

TEST(FanoutTracerTest, ForwardsToAllInOrder) {
  MockTracer first;
  MockTracer second;
  {
    InSequence seq;
    EXPECT_CALL(first, InputsEnqueued(ElementsAre("a", "b")));
    EXPECT_CALL(second, InputsEnqueued(ElementsAre("a", "b")));
    EXPECT_CALL(first, InputFaulted("a", FaultResult::Fault("k", "d")));
    EXPECT_CALL(second, InputFaulted("a", FaultResult::Fault("k", "d")));
    EXPECT_CALL(first, InputFuzzed("a", 3));
    EXPECT_CALL(second, InputFuzzed("a", 3));
    EXPECT_CALL(first, FuzzerFinished());
    EXPECT_CALL(second, FuzzerFinished());
  }
  FanoutTracer<std::string, int> fanout{{&first, &second}};
  const std::vector<std::string> inputs = {"a", "b"};
  fanout.InputsEnqueued(inputs);
  fanout.InputFaulted("a", FaultResult::Fault("k", "d"));
  fanout.InputFuzzed("a", 3);
  fanout.FuzzerFinished();
}

// Fails the test if two calls ever overlap.
class OverlapDetector : public Tracer<std::string, int> {
 public:
  void InputFuzzed(const std::string &input, const int &coverage) override {
    EXPECT_FALSE(inside_.exchange(true));
    for (volatile int i = 0; i < 1000; i = i + 1) {
    }
    ++num_calls_;
    inside_ = false;
  }

  int num_calls() const { return num_calls_; }

 private:
  std::atomic<bool> inside_ = false;
  int num_calls_ = 0;
};

TEST(TracerGatewayTest, SerializesConcurrentCalls) {
  constexpr int kNumThreads = 8;
  constexpr int kCallsPerThread = 1000;
  OverlapDetector detector;
  TracerGateway<std::string, int> gateway{detector};
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([&gateway] {
      for (int i = 0; i < kCallsPerThread; ++i) gateway.InputFuzzed("x", i);
    });
  }
  for (auto &thread : threads) thread.join();
  EXPECT_EQ(detector.num_calls(), kNumThreads * kCallsPerThread);
}

}  // namespace
}  // namespace sandpiper
