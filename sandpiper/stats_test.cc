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

#include "./sandpiper/stats.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "absl/time/time.h"
#include "./sandpiper/fault.h"

namespace sandpiper {
namespace {

TEST(FuzzerStatsTest, ToString) {
  FuzzerStats stats;
  EXPECT_EQ(stats.ToString(absl::ZeroDuration()),
            "execs: 0 enqueued: 0 dequeued: 0 faults: 0 minimizations: 0 "
            "novel_mutations: 0 execs/s: 0.0");
  stats.num_executions = 30;
  stats.num_faults = 2;
  EXPECT_EQ(stats.ToString(absl::Seconds(10)),
            "execs: 30 enqueued: 0 dequeued: 0 faults: 2 minimizations: 0 "
            "novel_mutations: 0 execs/s: 3.0");
}

TEST(StatsTracerTest, CountsNotifications) {
  FuzzerStats stats;
  StatsTracer<std::string, int> tracer{stats};
  const std::vector<std::string> inputs = {"a", "b", "c"};
  tracer.InputsEnqueued(inputs);
  tracer.InputsEnqueued(absl::MakeConstSpan(inputs).subspan(0, 1));
  tracer.InputDequeued("a");
  tracer.InputFuzzed("a", 1);
  tracer.InputFuzzed("b", 2);
  tracer.InputFaulted("b", FaultResult::Fault("x"));
  tracer.MinimizationFound("a", "");
  tracer.MutationFound("", "d");
  tracer.FuzzerFinished();

  EXPECT_EQ(stats.num_enqueued.load(), 4);
  EXPECT_EQ(stats.num_dequeued.load(), 1);
  EXPECT_EQ(stats.num_executions.load(), 2);
  EXPECT_EQ(stats.num_faults.load(), 1);
  EXPECT_EQ(stats.num_minimizations.load(), 1);
  EXPECT_EQ(stats.num_novel_mutations.load(), 1);
}

}  // namespace
}  // namespace sandpiper
