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

#ifndef SANDPIPER_LOGGING_TRACER_H_
#define SANDPIPER_LOGGING_TRACER_H_

#include "absl/types/span.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/tracer.h"

namespace sandpiper {

// Logs the interesting events of a byte-array fuzzing run: faults,
// minimizations, novel mutations and the end of the run at INFO, everything
// else at VLOG(2).
class LoggingTracer : public Tracer<ByteArray, CoverageCounters> {
 public:
  void InputsEnqueued(absl::Span<const ByteArray> inputs) override;
  void InputDequeued(const ByteArray &input) override;
  void InputFaulted(const ByteArray &input, const FaultResult &fault) override;
  void InputFuzzed(const ByteArray &input,
                   const CoverageCounters &coverage) override;
  void MinimizationFound(const ByteArray &original,
                         const ByteArray &minimized) override;
  void MutationFound(const ByteArray &original,
                     const ByteArray &mutated) override;
  void FuzzerFinished() override;
};

}  // namespace sandpiper

#endif  // SANDPIPER_LOGGING_TRACER_H_
