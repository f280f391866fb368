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

#include "./sandpiper/logging_tracer.h"

#include "absl/types/span.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/logging.h"
#include "./sandpiper/util.h"

namespace sandpiper {

void LoggingTracer::InputsEnqueued(absl::Span<const ByteArray> inputs) {
  VLOG(2) << "Enqueued " << inputs.size() << " input(s)";
}

void LoggingTracer::InputDequeued(const ByteArray &input) {
  VLOG(2) << "Dequeued " << AsPrintableString(input);
}

void LoggingTracer::InputFaulted(const ByteArray &input,
                                 const FaultResult &fault) {
  LOG(INFO) << "Input " << AsPrintableString(input, 64) << " faulted: "
            << fault;
}

void LoggingTracer::InputFuzzed(const ByteArray &input,
                                const CoverageCounters &coverage) {
  VLOG(2) << "Executed " << AsPrintableString(input) << " "
          << VV(coverage.NumNonZero());
}

void LoggingTracer::MinimizationFound(const ByteArray &original,
                                      const ByteArray &minimized) {
  LOG(INFO) << "Minimized " << AsPrintableString(original) << " ("
            << original.size() << " bytes) to " << AsPrintableString(minimized)
            << " (" << minimized.size() << " bytes)";
}

void LoggingTracer::MutationFound(const ByteArray &original,
                                  const ByteArray &mutated) {
  LOG(INFO) << "New coverage: " << AsPrintableString(original) << " -> "
            << AsPrintableString(mutated);
}

void LoggingTracer::FuzzerFinished() { LOG(INFO) << "Fuzzing finished"; }

}  // namespace sandpiper
