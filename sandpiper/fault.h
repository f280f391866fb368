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

#ifndef SANDPIPER_FAULT_H_
#define SANDPIPER_FAULT_H_

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"

namespace sandpiper {

// The outcome of fault detection for one execution of the target.
struct FaultResult {
  bool is_faulted = false;
  // Detector-specific classification of the fault, e.g. "signal:11" or
  // "INTERNAL". Empty iff !is_faulted.
  std::string kind;
  // Free-form diagnostics (stderr tail, status message, ...).
  std::string description;

  static FaultResult NoFault() { return {}; }
  static FaultResult Fault(std::string kind, std::string description = "") {
    return {/*is_faulted=*/true, std::move(kind), std::move(description)};
  }

  // Structural equality. Note that the fuzzer compares fault results through
  // a `FaultEquality` policy instead, see below.
  friend bool operator==(const FaultResult &a, const FaultResult &b) {
    return a.is_faulted == b.is_faulted && a.kind == b.kind &&
           a.description == b.description;
  }
  friend bool operator!=(const FaultResult &a, const FaultResult &b) {
    return !(a == b);
  }

  friend std::ostream &operator<<(std::ostream &os, const FaultResult &fault);

  template <typename Sink>
  friend void AbslStringify(Sink &sink, const FaultResult &fault) {
    sink.Append(fault.DebugString());
  }

  std::string DebugString() const;
};

// Decides whether two fault results count as "the same" outcome for the
// purpose of minimization: a minimized input must keep the fault of the
// original under this relation.
using FaultEquality =
    absl::AnyInvocable<bool(const FaultResult &, const FaultResult &) const>;

// The default `FaultEquality`: both are clean, or both faulted with the same
// kind. Descriptions are ignored, since they usually carry run-specific noise
// (addresses, timings).
bool SameFaultKind(const FaultResult &a, const FaultResult &b);

// The payload key under which a target attaches a fault kind to a non-OK
// `absl::Status`. See `FaultFromStatus()`.
inline constexpr std::string_view kFaultKindPayloadUrl =
    "type.sandpiper/fault_kind";

// Converts the status returned by a target execution into a fault result.
// OK means no fault. Otherwise the kind is the payload stored under
// `kFaultKindPayloadUrl`, if any, or the name of the status code.
FaultResult FaultFromStatus(const absl::Status &status);

// Returns `status` with `kind` attached as its fault kind payload.
absl::Status WithFaultKind(absl::Status status, std::string_view kind);

}  // namespace sandpiper

#endif  // SANDPIPER_FAULT_H_
