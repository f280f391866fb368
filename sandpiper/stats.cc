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

#include "./sandpiper/stats.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/time/time.h"

namespace sandpiper {

std::string FuzzerStats::ToString(absl::Duration elapsed) const {
  std::string result;
  for (const FieldInfo &info : kFieldInfos) {
    absl::StrAppend(&result, info.name, ": ", (this->*info.field).load(), " ");
  }
  const double seconds = absl::ToDoubleSeconds(elapsed);
  const double execs_per_second =
      seconds > 0 ? static_cast<double>(num_executions.load()) / seconds : 0;
  absl::StrAppend(&result, absl::StrFormat("execs/s: %.1f", execs_per_second));
  return result;
}

}  // namespace sandpiper
