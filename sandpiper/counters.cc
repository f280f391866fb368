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

#include "./sandpiper/counters.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "absl/functional/function_ref.h"

namespace sandpiper {

void CoverageCounters::Clear() {
  std::fill(counters_.begin(), counters_.end(), 0);
}

size_t CoverageCounters::NumNonZero() const {
  return counters_.size() -
         std::count(counters_.begin(), counters_.end(), uint8_t{0});
}

void CoverageCounters::ForEachNonZero(
    absl::FunctionRef<void(size_t location, uint8_t counter)> action) const {
  for (size_t i = 0; i < counters_.size(); ++i) {
    if (counters_[i] != 0) action(i, counters_[i]);
  }
}

FeatureVec CountersCompressor::Compress(
    const CoverageCounters &counters) const {
  FeatureVec features;
  features.reserve(counters.NumNonZero());
  // Locations are visited in increasing order, so `features` comes out
  // sorted.
  counters.ForEachNonZero([&features](size_t location, uint8_t counter) {
    features.push_back(Convert8bitCounterToNumber(location, counter));
  });
  return features;
}

}  // namespace sandpiper
