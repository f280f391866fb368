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


#include "./sandpiper/sandpiper_interface.h"

#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <utility>
#include <vector>

#include "absl/base/internal/raw_logging.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./sandpiper/byte_array_minimizer.h"
#include "./sandpiper/byte_array_mutator.h"
#include "./sandpiper/command_target.h"
#include "./sandpiper/corpus_loader.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/early_exit.h"
#include "./sandpiper/environment.h"
#include "./sandpiper/fuzzer.h"
#include "./sandpiper/logging.h"
#include "./sandpiper/logging_tracer.h"
#include "./sandpiper/periodic_action.h"
#include "./sandpiper/stats.h"
#include "./sandpiper/target.h"
#include "./sandpiper/tracer.h"

namespace sandpiper {

namespace {

// Sets signal handlers for SIGINT and SIGALRM, and arms an alarm that fires
// after `stop_after`.
void SetSignalHandlers(absl::Duration stop_after) {
  for (int signum : {SIGINT, SIGALRM}) {
    struct sigaction sigact = {};
    sigact.sa_handler = [](int received_signum) {
      if (received_signum == SIGINT) {
        ABSL_RAW_LOG(INFO, "Ctrl-C pressed: winding down");
        RequestEarlyExit(EXIT_FAILURE);  // => abnormal outcome
      } else if (received_signum == SIGALRM) {
        ABSL_RAW_LOG(INFO, "Reached --stop_after time: winding down");
        RequestEarlyExit(EXIT_SUCCESS);  // => expected outcome
      } else {
        ABSL_UNREACHABLE();
      }
    };
    sigaction(signum, &sigact, nullptr);
  }

  if (stop_after != absl::InfiniteDuration()) {
    // alarm() has a resolution of one second.
    const auto seconds = std::max<int64_t>(
        1, absl::ToInt64Seconds(absl::Ceil(stop_after, absl::Seconds(1))));
    LOG(INFO) << "Setting alarm for --stop_after " << stop_after << " (in "
              << seconds << "s)";
    PCHECK(alarm(seconds) == 0) << "Alarm already set";
  }
}

FuzzerOptions GetFuzzerOptions(const Environment &env) {
  return {
      .seed = env.seed,
      .max_parallelism = env.max_parallelism == 0
                             ? std::nullopt
                             : std::optional<size_t>(env.max_parallelism),
      .num_threads = env.num_threads,
      .await_in_flight_on_finish = env.await_in_flight_on_finish,
  };
}

}  // namespace

absl::Status Fuzz(const Environment &env, FuzzerStats &stats) {
  if (auto status = ValidateEnvironment(env); !status.ok()) return status;
  auto seed_inputs = LoadSeedInputs(env.corpus_files, env.corpus_dirs);
  if (!seed_inputs.ok()) return seed_inputs.status();
  if (seed_inputs->empty()) {
    LOG(INFO) << "No seed inputs given: starting from an empty input";
    seed_inputs->emplace_back();
  }

  CommandTarget target{{
      .binary = env.binary,
      .args = env.binary_args,
      .timeout = absl::Seconds(env.timeout_per_input),
      .work_dir = env.work_dir,
  }};
  CountersCompressor compressor;
  StatusFaultDetector<ByteArray> fault_detector;
  ByteArrayMinimizer minimizer;
  ByteArrayMutator mutator{{
      .num_mutants = env.num_mutants,
      .max_len = env.max_len,
  }};
  std::vector<ByteArray> dictionary;
  dictionary.reserve(env.dictionary.size());
  for (const auto &word : env.dictionary) {
    dictionary.emplace_back(word.begin(), word.end());
  }
  mutator.AddToDictionary(dictionary);
  LoggingTracer logging_tracer;
  StatsTracer<ByteArray, CoverageCounters> stats_tracer{stats};
  FanoutTracer<ByteArray, CoverageCounters> tracer{
      {&logging_tracer, &stats_tracer}};

  Fuzzer<ByteArray, CoverageCounters, FeatureVec> fuzzer{
      GetFuzzerOptions(env),
      {
          .executor = &target,
          .coverage_reader = &target,
          .coverage_compressor = &compressor,
          .fault_detector = &fault_detector,
          .minimizer = &minimizer,
          .mutator = &mutator,
          .tracer = &tracer,
      }};
  LOG(INFO) << "Fuzzing " << env.binary << " with " << seed_inputs->size()
            << " seed input(s); per-run files in " << target.work_dir();
  fuzzer.EnqueueRange(*std::move(seed_inputs));

  ClearEarlyExitRequest();
  SetSignalHandlers(env.stop_after);
  const absl::Time start_time = absl::Now();
  PeriodicAction stats_logger{
      [&stats, start_time]() {
        LOG(INFO) << "Stats: " << stats.ToString(absl::Now() - start_time);
      },
      {.delay = env.stats_log_interval, .interval = env.stats_log_interval},
  };
  fuzzer.Run(EarlyExitToken());
  stats_logger.Stop();
  // Disarm a pending alarm if the run was interrupted some other way.
  alarm(0);
  LOG(INFO) << "Final stats: " << stats.ToString(absl::Now() - start_time);
  return absl::OkStatus();
}

int SandpiperMain(const Environment &env) {
  FuzzerStats stats;
  if (auto status = Fuzz(env, stats); !status.ok()) {
    LOG(ERROR) << "Can't start fuzzing: " << status;
    return EXIT_FAILURE;
  }
  return ExitCode();
}

}  // namespace sandpiper
