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


#include "./sandpiper/environment_flags.h"

#include <cstddef>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/time/time.h"
#include "./sandpiper/environment.h"

static const auto *default_env = new sandpiper::Environment();

ABSL_FLAG(std::string, binary, default_env->binary,
          "The target binary. It is run once per input.");
ABSL_FLAG(std::vector<std::string>, binary_args, default_env->binary_args,
          "A comma-separated list of arguments for --binary. Every @@ is "
          "replaced with the path of a file holding the input. If no argument "
          "contains @@, the path is appended as the last argument.");
ABSL_FLAG(size_t, timeout_per_input, default_env->timeout_per_input,
          "If a single input runs longer than this number of seconds, the "
          "target is killed and the input is reported as a fault of kind "
          "'timeout'.");
ABSL_FLAG(std::string, work_dir, default_env->work_dir,
          "Directory for the per-run input and coverage files. If empty, a "
          "temporary directory is created and removed at exit.");
ABSL_FLAG(size_t, seed, default_env->seed,
          "A seed for the random number generator. If 0, some other random "
          "number is used as seed.");
ABSL_FLAG(size_t, max_parallelism, default_env->max_parallelism,
          "The maximum number of queue entries processed at the same time. "
          "1 processes entries one by one on the main thread, which makes "
          "runs with the same --seed deterministic. 0 means no limit beyond "
          "--num_threads.");
ABSL_FLAG(size_t, num_threads, default_env->num_threads,
          "Number of worker threads used when --max_parallelism is not 1. "
          "0 means one per hardware thread.");
ABSL_FLAG(bool, await_in_flight_on_finish,
          default_env->await_in_flight_on_finish,
          "When the run is stopped, let entries that are already being "
          "processed finish before reporting that fuzzing finished.");
ABSL_FLAG(absl::Duration, stop_after, default_env->stop_after,
          "Stop fuzzing after this much time, e.g. '30s' or '2h'. Fuzzing "
          "runs until interrupted by default.");
ABSL_FLAG(size_t, max_len, default_env->max_len,
          "Max length of mutants. Passed to mutator.");
ABSL_FLAG(size_t, num_mutants, default_env->num_mutants,
          "Number of mutants derived from every queue entry that doesn't "
          "fault.");
ABSL_FLAG(std::vector<std::string>, dictionary, default_env->dictionary,
          "A comma-separated list of byte strings the mutator may insert "
          "into inputs.");
ABSL_FLAG(std::vector<std::string>, corpus_files, default_env->corpus_files,
          "A comma-separated list of files whose contents seed the queue.");
ABSL_FLAG(std::vector<std::string>, corpus_dirs, default_env->corpus_dirs,
          "A comma-separated list of directories. Every regular file in them "
          "seeds the queue, in sorted path order.");
ABSL_FLAG(absl::Duration, stats_log_interval, default_env->stats_log_interval,
          "How often the run statistics are logged.");

namespace sandpiper {

Environment CreateEnvironmentFromFlags() {
  return {
      .binary = absl::GetFlag(FLAGS_binary),
      .binary_args = absl::GetFlag(FLAGS_binary_args),
      .timeout_per_input = absl::GetFlag(FLAGS_timeout_per_input),
      .work_dir = absl::GetFlag(FLAGS_work_dir),
      .seed = absl::GetFlag(FLAGS_seed),
      .max_parallelism = absl::GetFlag(FLAGS_max_parallelism),
      .num_threads = absl::GetFlag(FLAGS_num_threads),
      .await_in_flight_on_finish =
          absl::GetFlag(FLAGS_await_in_flight_on_finish),
      .stop_after = absl::GetFlag(FLAGS_stop_after),
      .max_len = absl::GetFlag(FLAGS_max_len),
      .num_mutants = absl::GetFlag(FLAGS_num_mutants),
      .dictionary = absl::GetFlag(FLAGS_dictionary),
      .corpus_files = absl::GetFlag(FLAGS_corpus_files),
      .corpus_dirs = absl::GetFlag(FLAGS_corpus_dirs),
      .stats_log_interval = absl::GetFlag(FLAGS_stats_log_interval),
  };
}

}  // namespace sandpiper
