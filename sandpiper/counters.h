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

// Raw edge-hit counters and their compression into features, for targets
// whose coverage is a flat array of 8-bit counters (one per instrumented
// location), the way SanitizerCoverage's inline-8bit-counters work.

#ifndef SANDPIPER_COUNTERS_H_
#define SANDPIPER_COUNTERS_H_

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/functional/function_ref.h"
#include "./sandpiper/coverage.h"
#include "./sandpiper/defs.h"

namespace sandpiper {

// A feature is a compressed coverage element. A run's compressed coverage is
// the sorted vector of its features.
using feature_t = uint64_t;
using FeatureVec = std::vector<feature_t>;

// Returns the AFL-style bucket of a non-zero `counter`, in [0, 8):
// 1, 2, 3, 4-7, 8-15, 16-31, 32-127, 128-255.
constexpr uint8_t CounterToBucket(uint8_t counter) {
  if (counter >= 128) return 7;
  if (counter >= 32) return 6;
  if (counter >= 16) return 5;
  if (counter >= 8) return 4;
  if (counter >= 4) return 3;
  return counter - 1;
}

// Maps the `counter` value observed at `location` to a single number.
// Counters that land in the same bucket map to the same number.
constexpr feature_t Convert8bitCounterToNumber(size_t location,
                                               uint8_t counter) {
  return static_cast<feature_t>(location) * 8 + CounterToBucket(counter);
}

// Saturating 8-bit hit counters, one per location. Grows on demand.
class CoverageCounters {
 public:
  CoverageCounters() = default;
  explicit CoverageCounters(size_t num_locations) : counters_(num_locations) {}
  explicit CoverageCounters(ByteArray counters)
      : counters_(std::move(counters)) {}

  // Records one hit of `location`.
  void Hit(size_t location) {
    if (location >= counters_.size()) counters_.resize(location + 1);
    if (counters_[location] != 0xFF) ++counters_[location];
  }

  // Resets all counters to zero, keeping the size.
  void Clear();

  uint8_t operator[](size_t location) const {
    return location < counters_.size() ? counters_[location] : 0;
  }
  size_t size() const { return counters_.size(); }
  size_t NumNonZero() const;
  ByteSpan bytes() const { return counters_; }

  // Calls `action(location, counter)` for every non-zero counter, in order of
  // location.
  void ForEachNonZero(
      absl::FunctionRef<void(size_t location, uint8_t counter)> action) const;

  friend bool operator==(const CoverageCounters &a,
                         const CoverageCounters &b) {
    return a.counters_ == b.counters_;
  }
  friend bool operator!=(const CoverageCounters &a,
                         const CoverageCounters &b) {
    return !(a == b);
  }

 private:
  ByteArray counters_;
};

// Compresses counters into their sorted features. Two runs that hit the same
// locations with counts in the same buckets compress to the same value.
class CountersCompressor
    : public CoverageCompressor<CoverageCounters, FeatureVec> {
 public:
  FeatureVec Compress(const CoverageCounters &counters) const override;
};

}  // namespace sandpiper

#endif  // SANDPIPER_COUNTERS_H_
