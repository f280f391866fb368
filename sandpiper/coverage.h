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

#ifndef SANDPIPER_COVERAGE_H_
#define SANDPIPER_COVERAGE_H_

#include "./sandpiper/target.h"

namespace sandpiper {

// Reads the raw coverage produced by one execution of the target.
// Implementations must be thread-safe if the fuzzer runs with parallelism
// other than 1.
template <typename RawCoverage>
class CoverageReader {
 public:
  virtual ~CoverageReader() = default;

  // Discards any stale coverage for `target_info` before the target runs.
  virtual void Clear(const TargetInfo &target_info) = 0;

  // Returns the coverage collected for `target_info` since `Clear()`.
  virtual RawCoverage Read(const TargetInfo &target_info) = 0;
};

// Reduces raw coverage to the form the fuzzer compares and remembers.
// `Compress()` must be deterministic: equal raw coverage must always produce
// equal (and equally hashed) compressed coverage.
template <typename RawCoverage, typename Coverage>
class CoverageCompressor {
 public:
  virtual ~CoverageCompressor() = default;

  virtual Coverage Compress(const RawCoverage &raw_coverage) const = 0;
};

}  // namespace sandpiper

#endif  // SANDPIPER_COVERAGE_H_
