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

#ifndef SANDPIPER_SEEN_COVERAGE_SET_H_
#define SANDPIPER_SEEN_COVERAGE_SET_H_

#include <cstddef>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

namespace sandpiper {

// The set of compressed coverage values observed so far in a fuzzing run.
// It only ever grows. Thread-safe.
//
// `Coverage` must be usable as an `absl::flat_hash_set` key, i.e. support
// `operator==` and `absl::Hash`.
template <typename Coverage>
class SeenCoverageSet {
 public:
  SeenCoverageSet() = default;

  SeenCoverageSet(const SeenCoverageSet &) = delete;
  SeenCoverageSet &operator=(const SeenCoverageSet &) = delete;

  // Atomically checks for and inserts `coverage`. Returns true iff `coverage`
  // was not in the set before this call, i.e. it is novel. For any given
  // value, at most one call ever returns true.
  bool InsertIfNovel(Coverage coverage) {
    absl::MutexLock lock(&mu_);
    return seen_.insert(std::move(coverage)).second;
  }

  bool Contains(const Coverage &coverage) const {
    absl::MutexLock lock(&mu_);
    return seen_.contains(coverage);
  }

  size_t size() const {
    absl::MutexLock lock(&mu_);
    return seen_.size();
  }

 private:
  mutable absl::Mutex mu_;
  absl::flat_hash_set<Coverage> seen_ ABSL_GUARDED_BY(mu_);
};

}  // namespace sandpiper

#endif  // SANDPIPER_SEEN_COVERAGE_SET_H_
