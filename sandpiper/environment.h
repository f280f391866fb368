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


#ifndef SANDPIPER_ENVIRONMENT_H_
#define SANDPIPER_ENVIRONMENT_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"

namespace sandpiper {

// Settings of one command line fuzzing run. Populated from the flags by
// `CreateEnvironmentFromFlags()`; tests may build one directly and override
// any field before passing it to `SandpiperMain()`. See the flag
// descriptions in environment_flags.cc for the meaning of each field.
struct Environment {
  // Target --------------------------------------------------------------------

  std::string binary;
  std::vector<std::string> binary_args = {"@@"};
  size_t timeout_per_input = 10;  // seconds
  std::string work_dir;

  // Fuzzing loop --------------------------------------------------------------

  size_t seed = 0;
  size_t max_parallelism = 0;  // 0 means uncapped.
  size_t num_threads = 0;
  bool await_in_flight_on_finish = true;
  absl::Duration stop_after = absl::InfiniteDuration();

  // Inputs --------------------------------------------------------------------

  size_t max_len = 4096;
  size_t num_mutants = 16;
  std::vector<std::string> dictionary;
  std::vector<std::string> corpus_files;
  std::vector<std::string> corpus_dirs;

  // Reporting -----------------------------------------------------------------

  absl::Duration stats_log_interval = absl::Seconds(60);
};

// Returns an error describing the first problem with `env` that would make a
// run impossible or meaningless, or OK.
absl::Status ValidateEnvironment(const Environment &env);

}  // namespace sandpiper

#endif  // SANDPIPER_ENVIRONMENT_H_
