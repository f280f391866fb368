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

#ifndef SANDPIPER_STATS_H_
#define SANDPIPER_STATS_H_

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/tracer.h"

namespace sandpiper {

// Counters describing the progress of one fuzzing run. Updated by
// `StatsTracer` and read concurrently by a stats logger, hence the atomics.
struct FuzzerStats {
  std::atomic<uint64_t> num_executions = 0;
  std::atomic<uint64_t> num_enqueued = 0;
  std::atomic<uint64_t> num_dequeued = 0;
  std::atomic<uint64_t> num_faults = 0;
  std::atomic<uint64_t> num_minimizations = 0;
  std::atomic<uint64_t> num_novel_mutations = 0;

  struct FieldInfo {
    std::atomic<uint64_t> FuzzerStats::*field;
    // The human-readable name of the field. Used in logging.
    std::string_view name;
  };

  static constexpr FieldInfo kFieldInfos[] = {
      {&FuzzerStats::num_executions, "execs"},
      {&FuzzerStats::num_enqueued, "enqueued"},
      {&FuzzerStats::num_dequeued, "dequeued"},
      {&FuzzerStats::num_faults, "faults"},
      {&FuzzerStats::num_minimizations, "minimizations"},
      {&FuzzerStats::num_novel_mutations, "novel_mutations"},
  };

  // Returns e.g. "execs: 120 enqueued: 7 ... execs/s: 60.0", with the rate
  // computed over `elapsed`.
  std::string ToString(absl::Duration elapsed) const;
};

// Feeds a `FuzzerStats`.
template <typename Input, typename RawCoverage>
class StatsTracer : public Tracer<Input, RawCoverage> {
 public:
  explicit StatsTracer(FuzzerStats &stats) : stats_(stats) {}

  void InputsEnqueued(absl::Span<const Input> inputs) override {
    stats_.num_enqueued += inputs.size();
  }
  void InputDequeued(const Input &input) override { ++stats_.num_dequeued; }
  void InputFaulted(const Input &input, const FaultResult &fault) override {
    ++stats_.num_faults;
  }
  void InputFuzzed(const Input &input, const RawCoverage &coverage) override {
    ++stats_.num_executions;
  }
  void MinimizationFound(const Input &original,
                         const Input &minimized) override {
    ++stats_.num_minimizations;
  }
  void MutationFound(const Input &original, const Input &mutated) override {
    ++stats_.num_novel_mutations;
  }

 private:
  FuzzerStats &stats_;
};

}  // namespace sandpiper

#endif  // SANDPIPER_STATS_H_
