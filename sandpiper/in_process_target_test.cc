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

#include "./sandpiper/in_process_target.h"

#include <string>
#include <string_view>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "./sandpiper/byte_array_minimizer.h"
#include "./sandpiper/byte_array_mutator.h"
#include "./sandpiper/cancellation.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/fuzzer.h"
#include "./sandpiper/target.h"
#include "./sandpiper/tracer.h"

namespace sandpiper {
namespace {

using ::testing::ElementsAre;

ByteArray AsBytes(std::string_view str) {
  return ByteArray(str.begin(), str.end());
}

// Hits location 0 always and location 1 if `input` contains "ab", which is
// also the condition under which it fails.
absl::Status ContainsAb(ByteSpan input, CoverageCounters &counters) {
  counters.Hit(0);
  const std::string_view str(reinterpret_cast<const char *>(input.data()),
                             input.size());
  if (str.find("ab") == std::string_view::npos) return absl::OkStatus();
  counters.Hit(1);
  return absl::InternalError("found ab");
}

TEST(InProcessTargetTest, ExecutesCallbackOnInput) {
  std::vector<ByteArray> seen_inputs;
  InProcessTarget target{[&seen_inputs](ByteSpan input, CoverageCounters &) {
    seen_inputs.emplace_back(input.begin(), input.end());
    return absl::OkStatus();
  }};
  const TargetInfo info = target.Initialize(AsBytes("xyz"));
  EXPECT_TRUE(info.has_state());
  EXPECT_TRUE(target.Execute(info).ok());
  EXPECT_THAT(seen_inputs, ElementsAre(AsBytes("xyz")));
}

TEST(InProcessTargetTest, RunsHaveSeparateCounters) {
  InProcessTarget target{ContainsAb};
  const TargetInfo plain = target.Initialize(AsBytes("xx"));
  const TargetInfo failing = target.Initialize(AsBytes("ab"));
  EXPECT_NE(plain.run_id(), failing.run_id());

  target.Clear(plain);
  target.Clear(failing);
  EXPECT_TRUE(target.Execute(plain).ok());
  EXPECT_FALSE(target.Execute(failing).ok());
  EXPECT_EQ(target.Read(plain), CoverageCounters{ByteArray{1}});
  EXPECT_EQ(target.Read(failing), (CoverageCounters{ByteArray{1, 1}}));

  // Re-running after `Clear()` starts from scratch.
  target.Clear(failing);
  EXPECT_FALSE(target.Execute(failing).ok());
  EXPECT_EQ(target.Read(failing), (CoverageCounters{ByteArray{1, 1}}));
}

TEST(InProcessTargetTest, StatusBecomesFault) {
  InProcessTarget target{ContainsAb};
  StatusFaultDetector<ByteArray> detector;
  EXPECT_EQ(detector.Detect(target, target.Initialize(AsBytes("a"))),
            FaultResult::NoFault());
  EXPECT_EQ(detector.Detect(target, target.Initialize(AsBytes("xaby"))),
            FaultResult::Fault("INTERNAL", "found ab"));
}

TEST(InProcessTargetTest, GlobalInitializerRunsOnRequest) {
  int num_initializations = 0;
  InProcessTarget target{
      [](ByteSpan, CoverageCounters &) { return absl::OkStatus(); },
      [&num_initializations] { ++num_initializations; }};
  EXPECT_EQ(num_initializations, 0);
  target.GlobalInitialize();
  EXPECT_EQ(num_initializations, 1);

  InProcessTarget without_initializer{
      [](ByteSpan, CoverageCounters &) { return absl::OkStatus(); }};
  without_initializer.GlobalInitialize();
}

// Records minimizations and cancels the run after the first dequeue.
class MinimizationRecorder : public Tracer<ByteArray, CoverageCounters> {
 public:
  void InputDequeued(const ByteArray &input) override {
    cancellation_.Cancel();
  }
  void InputFaulted(const ByteArray &input, const FaultResult &fault) override {
    ++num_faults_;
  }
  void MinimizationFound(const ByteArray &original,
                         const ByteArray &minimized) override {
    minimized_.push_back(minimized);
  }

  const CancellationToken &cancellation() const { return cancellation_; }
  const std::vector<ByteArray> &minimized() const { return minimized_; }
  int num_faults() const { return num_faults_; }

 private:
  CancellationToken cancellation_;
  std::vector<ByteArray> minimized_;
  int num_faults_ = 0;
};

TEST(InProcessTargetTest, FuzzerMinimizesFailingInput) {
  InProcessTarget target{ContainsAb};
  CountersCompressor compressor;
  StatusFaultDetector<ByteArray> detector;
  ByteArrayMinimizer minimizer;
  ByteArrayMutator mutator{{}};
  MinimizationRecorder tracer;
  Fuzzer<ByteArray, CoverageCounters, FeatureVec> fuzzer{
      {.seed = 1, .max_parallelism = 1},
      {
          .executor = &target,
          .coverage_reader = &target,
          .coverage_compressor = &compressor,
          .fault_detector = &detector,
          .minimizer = &minimizer,
          .mutator = &mutator,
          .tracer = &tracer,
      }};
  fuzzer.Enqueue(AsBytes("xxabyy"));
  fuzzer.Run(tracer.cancellation());

  EXPECT_THAT(tracer.minimized(),
              ElementsAre(AsBytes("xabyy"), AsBytes("xaby"), AsBytes("aby"),
                          AsBytes("ab")));
  EXPECT_EQ(tracer.num_faults(), 5);
}

}  // namespace
}  // namespace sandpiper
