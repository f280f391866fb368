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


#include "./sandpiper/environment.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

namespace sandpiper {

absl::Status ValidateEnvironment(const Environment &env) {
  if (env.binary.empty()) {
    return absl::InvalidArgumentError("--binary must be set");
  }
  if (env.timeout_per_input == 0) {
    return absl::InvalidArgumentError("--timeout_per_input must be positive");
  }
  if (env.max_len == 0) {
    return absl::InvalidArgumentError("--max_len must be positive");
  }
  if (env.num_mutants == 0) {
    return absl::InvalidArgumentError("--num_mutants must be positive");
  }
  if (env.max_parallelism > 1 && env.num_threads != 0 &&
      env.num_threads < env.max_parallelism) {
    return absl::InvalidArgumentError(absl::StrCat(
        "--num_threads (", env.num_threads,
        ") can't be smaller than --max_parallelism (", env.max_parallelism,
        ")"));
  }
  if (env.stop_after <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("--stop_after must be positive");
  }
  if (env.stats_log_interval <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError(
        "--stats_log_interval must be positive");
  }
  for (const auto &word : env.dictionary) {
    if (word.empty()) {
      return absl::InvalidArgumentError("--dictionary has an empty entry");
    }
  }
  return absl::OkStatus();
}

}  // namespace sandpiper
