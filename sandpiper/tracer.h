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

#ifndef SANDPIPER_TRACER_H_
#define SANDPIPER_TRACER_H_

#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "./sandpiper/fault.h"

namespace sandpiper {

// Observes the progress of a fuzzing run. Purely observational: a tracer
// must not call back into the fuzzer and must not block for long, since every
// callback runs under a lock shared by all workers (see `TracerGateway`).
// All callbacks default to no-ops.
template <typename Input, typename RawCoverage>
class Tracer {
 public:
  virtual ~Tracer() = default;

  // `inputs` were added to the work queue, either by the user or because they
  // produced novel coverage.
  virtual void InputsEnqueued(absl::Span<const Input> inputs) {}
  // `input` was taken off the work queue for processing.
  virtual void InputDequeued(const Input &input) {}
  // Executing `input` faulted.
  virtual void InputFaulted(const Input &input, const FaultResult &fault) {}
  // `input` was executed and produced `coverage`.
  virtual void InputFuzzed(const Input &input, const RawCoverage &coverage) {}
  // `minimized` behaves the same as `original` and replaces it.
  virtual void MinimizationFound(const Input &original,
                                 const Input &minimized) {}
  // Mutating `original` produced `mutated`, which has novel coverage.
  virtual void MutationFound(const Input &original, const Input &mutated) {}
  // The fuzzing loop has stopped. Sent exactly once per `Run()`.
  virtual void FuzzerFinished() {}
};

// Forwards every callback to each of a list of tracers, in list order.
// Does not own the tracers.
template <typename Input, typename RawCoverage>
class FanoutTracer : public Tracer<Input, RawCoverage> {
 public:
  using TracerT = Tracer<Input, RawCoverage>;

  explicit FanoutTracer(std::vector<TracerT *> tracers)
      : tracers_(std::move(tracers)) {}

  void InputsEnqueued(absl::Span<const Input> inputs) override {
    for (TracerT *tracer : tracers_) tracer->InputsEnqueued(inputs);
  }
  void InputDequeued(const Input &input) override {
    for (TracerT *tracer : tracers_) tracer->InputDequeued(input);
  }
  void InputFaulted(const Input &input, const FaultResult &fault) override {
    for (TracerT *tracer : tracers_) tracer->InputFaulted(input, fault);
  }
  void InputFuzzed(const Input &input, const RawCoverage &coverage) override {
    for (TracerT *tracer : tracers_) tracer->InputFuzzed(input, coverage);
  }
  void MinimizationFound(const Input &original,
                         const Input &minimized) override {
    for (TracerT *tracer : tracers_) {
      tracer->MinimizationFound(original, minimized);
    }
  }
  void MutationFound(const Input &original, const Input &mutated) override {
    for (TracerT *tracer : tracers_) tracer->MutationFound(original, mutated);
  }
  void FuzzerFinished() override {
    for (TracerT *tracer : tracers_) tracer->FuzzerFinished();
  }

 private:
  std::vector<TracerT *> tracers_;
};

// The single entry point through which the fuzzer notifies its tracer. Every
// notification is issued under one mutex, so concurrent workers never
// interleave inside the tracer and it observes a strict total order of
// callbacks. Thread-safe.
template <typename Input, typename RawCoverage>
class TracerGateway {
 public:
  explicit TracerGateway(Tracer<Input, RawCoverage> &tracer)
      : tracer_(&tracer) {}

  TracerGateway(const TracerGateway &) = delete;
  TracerGateway &operator=(const TracerGateway &) = delete;

  void InputsEnqueued(absl::Span<const Input> inputs) {
    absl::MutexLock lock(&mu_);
    tracer_->InputsEnqueued(inputs);
  }
  void InputDequeued(const Input &input) {
    absl::MutexLock lock(&mu_);
    tracer_->InputDequeued(input);
  }
  void InputFaulted(const Input &input, const FaultResult &fault) {
    absl::MutexLock lock(&mu_);
    tracer_->InputFaulted(input, fault);
  }
  void InputFuzzed(const Input &input, const RawCoverage &coverage) {
    absl::MutexLock lock(&mu_);
    tracer_->InputFuzzed(input, coverage);
  }
  void MinimizationFound(const Input &original, const Input &minimized) {
    absl::MutexLock lock(&mu_);
    tracer_->MinimizationFound(original, minimized);
  }
  void MutationFound(const Input &original, const Input &mutated) {
    absl::MutexLock lock(&mu_);
    tracer_->MutationFound(original, mutated);
  }
  void FuzzerFinished() {
    absl::MutexLock lock(&mu_);
    tracer_->FuzzerFinished();
  }

 private:
  absl::Mutex mu_;
  Tracer<Input, RawCoverage> *const tracer_ ABSL_PT_GUARDED_BY(mu_);
};

}  // namespace sandpiper

#endif  // SANDPIPER_TRACER_H_
