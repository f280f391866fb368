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

#ifndef SANDPIPER_IN_PROCESS_TARGET_H_
#define SANDPIPER_IN_PROCESS_TARGET_H_

#include <atomic>
#include <cstdint>

#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/coverage.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/target.h"

namespace sandpiper {

// Runs a callback in the fuzzer's own process. The callback reports coverage
// by hitting locations in the counters it is given, and reports misbehavior
// by returning a non-OK status: `FaultFromStatus()` turns that into a fault.
//
// Every run gets its own counters, so concurrent runs never share coverage
// state; the callback itself must be thread-safe if used with parallelism
// other than 1.
class InProcessTarget : public TargetExecutor<ByteArray>,
                        public CoverageReader<CoverageCounters> {
 public:
  using Callback =
      absl::AnyInvocable<absl::Status(ByteSpan input, CoverageCounters &)>;
  using GlobalInitializer = absl::AnyInvocable<void()>;

  explicit InProcessTarget(Callback callback,
                           GlobalInitializer global_initializer = nullptr);

  void GlobalInitialize() override;
  TargetInfo Initialize(const ByteArray &input) override;
  absl::Status Execute(const TargetInfo &target_info) override;

  void Clear(const TargetInfo &target_info) override;
  CoverageCounters Read(const TargetInfo &target_info) override;

 private:
  // The per-run state carried by `TargetInfo`.
  struct Run {
    ByteArray input;
    CoverageCounters counters;
  };

  Callback callback_;
  GlobalInitializer global_initializer_;
  std::atomic<uint64_t> next_run_id_ = 0;
};

}  // namespace sandpiper

#endif  // SANDPIPER_IN_PROCESS_TARGET_H_
