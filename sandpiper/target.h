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

#ifndef SANDPIPER_TARGET_H_
#define SANDPIPER_TARGET_H_

#include <cstdint>
#include <memory>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "./sandpiper/fault.h"

namespace sandpiper {

// An opaque handle for one execution of the target, created by
// `TargetExecutor::Initialize()`. It is passed to the coverage reader and the
// fault detector of the same pipeline pass and then dropped; it must not be
// kept across passes. The executor may attach arbitrary per-run state, which
// is destroyed together with the last copy of the handle.
class TargetInfo {
 public:
  TargetInfo() = default;
  TargetInfo(uint64_t run_id, std::shared_ptr<void> state)
      : run_id_(run_id), state_(std::move(state)) {}

  // Unique within one executor.
  uint64_t run_id() const { return run_id_; }

  bool has_state() const { return state_ != nullptr; }

  // Returns the per-run state attached by the executor. `State` must be the
  // type the executor created it with.
  template <typename State>
  State &state() const {
    CHECK(state_ != nullptr) << "TargetInfo for run " << run_id_
                             << " carries no state";
    return *static_cast<State *>(state_.get());
  }

 private:
  uint64_t run_id_ = 0;
  std::shared_ptr<void> state_;
};

// Knows how to run the system under test against one input.
// Implementations must be thread-safe if the fuzzer runs with parallelism
// other than 1.
template <typename Input>
class TargetExecutor {
 public:
  virtual ~TargetExecutor() = default;

  // Called once per fuzzing run, before any coverage is captured, so that
  // one-time setup of the target is not attributed to the first input.
  virtual void GlobalInitialize() {}

  // Prepares one run of the target on `input`.
  virtual TargetInfo Initialize(const Input &input) = 0;

  // Runs the target prepared by `Initialize()`. Returns a non-OK status iff
  // the target misbehaved; see `FaultFromStatus()` for how statuses map to
  // faults. Invoked by the fault detector, never by the fuzzer directly.
  virtual absl::Status Execute(const TargetInfo &target_info) = 0;
};

// Drives the actual execution of a target and reports whether it faulted.
template <typename Input>
class FaultDetector {
 public:
  virtual ~FaultDetector() = default;

  virtual FaultResult Detect(TargetExecutor<Input> &executor,
                             const TargetInfo &target_info) = 0;
};

// Runs the target once and classifies the returned status with
// `FaultFromStatus()`.
template <typename Input>
class StatusFaultDetector : public FaultDetector<Input> {
 public:
  FaultResult Detect(TargetExecutor<Input> &executor,
                     const TargetInfo &target_info) override {
    return FaultFromStatus(executor.Execute(target_info));
  }
};

}  // namespace sandpiper

#endif  // SANDPIPER_TARGET_H_
