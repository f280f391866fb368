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

#include "./sandpiper/fault.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace sandpiper {

std::string FaultResult::DebugString() const {
  if (!is_faulted) return "no fault";
  if (description.empty()) return absl::StrCat("fault ", kind);
  return absl::StrCat("fault ", kind, ": ", description);
}

std::ostream &operator<<(std::ostream &os, const FaultResult &fault) {
  return os << fault.DebugString();
}

bool SameFaultKind(const FaultResult &a, const FaultResult &b) {
  return a.is_faulted == b.is_faulted && a.kind == b.kind;
}

FaultResult FaultFromStatus(const absl::Status &status) {
  if (status.ok()) return FaultResult::NoFault();
  std::optional<absl::Cord> kind = status.GetPayload(kFaultKindPayloadUrl);
  return FaultResult::Fault(
      kind.has_value() ? std::string(*kind)
                       : absl::StatusCodeToString(status.code()),
      std::string(status.message()));
}

absl::Status WithFaultKind(absl::Status status, std::string_view kind) {
  status.SetPayload(kFaultKindPayloadUrl, absl::Cord(kind));
  return status;
}

}  // namespace sandpiper
