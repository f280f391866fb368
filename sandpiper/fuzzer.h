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

// The fuzzing loop. `Fuzzer` follows the classic AFL recipe, repeated for
// every entry taken off its work queue:
//   1. Minimize the entry's input while it keeps behaving the same way.
//   2. Unless the minimized input faults, mutate it and execute the mutants.
// Every execution whose compressed coverage has never been seen before puts
// the executed input back onto the queue, which closes the loop.
//
// What an input, a coverage value or a target is, is left to the plugins
// passed in `FuzzerPlugins`.
//
// Example:
//   FuzzerPlugins<ByteArray, CoverageCounters, FeatureVec> plugins = {...};
//   Fuzzer<ByteArray, CoverageCounters, FeatureVec> fuzzer{{.seed = 1},
//                                                          plugins};
//   fuzzer.EnqueueRange(seed_inputs);
//   fuzzer.Run(EarlyExitToken());  // Returns once the token is cancelled.

#ifndef SANDPIPER_FUZZER_H_
#define SANDPIPER_FUZZER_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "./sandpiper/admission_slots.h"
#include "./sandpiper/cancellation.h"
#include "./sandpiper/coverage.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/input_stream.h"
#include "./sandpiper/logging.h"
#include "./sandpiper/seen_coverage_set.h"
#include "./sandpiper/target.h"
#include "./sandpiper/thread_pool.h"
#include "./sandpiper/tracer.h"
#include "./sandpiper/util.h"
#include "./sandpiper/work_queue.h"

namespace sandpiper {

// The minimal summary of one execution of the target.
template <typename Coverage>
struct ExecutionResult {
  Coverage coverage;
  FaultResult fault;
};

// One unit of fuzzing work. Inputs enqueued by the user have no execution
// result yet; it is computed when the entry is first minimized. Entries
// enqueued by the fuzzer itself always carry one. Once set, the result is
// never modified: minimization produces new entries instead.
template <typename Input, typename Coverage>
struct QueueEntry {
  Input input;
  std::optional<ExecutionResult<Coverage>> execution_result;
};

// The strategies a `Fuzzer` is assembled from. The fuzzer does not own them;
// they must outlive it. With parallelism other than 1 they are called from
// several threads at once, except for `tracer`, which is always serialized.
// None of the pointers may be null.
template <typename Input, typename RawCoverage, typename Coverage>
struct FuzzerPlugins {
  TargetExecutor<Input> *executor;
  CoverageReader<RawCoverage> *coverage_reader;
  const CoverageCompressor<RawCoverage, Coverage> *coverage_compressor;
  FaultDetector<Input> *fault_detector;
  InputMinimizer<Input> *minimizer;
  InputMutator<Input> *mutator;
  Tracer<Input, RawCoverage> *tracer;
  // Decides which fault results count as equal during minimization.
  FaultEquality fault_equality = SameFaultKind;
};

struct FuzzerOptions {
  // Seed for all randomness in the run. 0 means pick one at random; the
  // chosen value is available via `Fuzzer::seed()`.
  size_t seed = 0;
  // The maximum number of entries processed at the same time. 1 processes
  // entries one by one on the thread calling `Run()`, which makes the whole
  // run deterministic for a given seed. nullopt means no limit beyond the
  // size of the worker pool.
  std::optional<size_t> max_parallelism = std::nullopt;
  // The number of worker threads when `max_parallelism != 1`. 0 means one
  // per hardware thread.
  size_t num_threads = 0;
  // If true, `Run()` waits for entries that are already being processed to
  // finish before sending `FuzzerFinished()`. If false, the notification
  // goes out as soon as the loop stops; `Run()` still joins the workers
  // before returning.
  bool await_in_flight_on_finish = true;
  // How long the loop sleeps before polling an empty queue again.
  absl::Duration idle_backoff = absl::Milliseconds(1);
};

template <typename Input, typename RawCoverage, typename Coverage>
class Fuzzer {
 public:
  using Entry = QueueEntry<Input, Coverage>;
  using Result = ExecutionResult<Coverage>;

  // What the execution pipeline reports for one input.
  struct Execution {
    Result result;
    // True iff the coverage had not been seen before in this run.
    bool is_novel = false;
  };

  Fuzzer(FuzzerOptions options,
         FuzzerPlugins<Input, RawCoverage, Coverage> plugins);

  Fuzzer(const Fuzzer &) = delete;
  Fuzzer &operator=(const Fuzzer &) = delete;

  // Adds `input` to the work queue.
  void Enqueue(Input input);
  // Adds `inputs` to the work queue, in order, with a single tracer
  // notification.
  void EnqueueRange(std::vector<Input> inputs);

  // Runs the fuzzing loop on the calling thread until `cancellation` is
  // cancelled. The queue can always receive more work, so the loop never
  // ends on its own. Sends `FuzzerFinished()` exactly once. Entries already
  // handed to the worker pool are still processed after cancellation, except
  // those waiting for an admission slot, which are dropped.
  void Run(const CancellationToken &cancellation);

  // The building blocks of `Run()`. Exposed for tools and tests that want to
  // drive a single step; all of them are thread-safe.

  // The execution pipeline: runs `input` through the target, classifies its
  // coverage and, if the coverage is novel and `requeue_on_novelty` is set,
  // enqueues the input together with its result.
  Execution Execute(const Input &input, bool requeue_on_novelty = true);

  // Shrinks `entry` to a fixpoint of the minimizer plugin. Returns an entry
  // whose execution result is equivalent to the original's (see
  // `AreEquivalent()`); the returned entry always has a result.
  Entry Minimize(Entry entry, Rng &rng);

  // Executes every mutant the mutator plugin derives from `entry`.
  // `entry` must not be known to fault.
  void Mutate(const Entry &entry, Rng &rng);

  // Minimizes `entry` and, unless the result faults, mutates it.
  void ProcessEntry(Entry entry, Rng &rng);

  // Two executions are equivalent iff they have equal compressed coverage
  // and equal faults under the configured `FaultEquality`.
  bool AreEquivalent(const Result &a, const Result &b) const;

  // Returns the generator used for the `entry_index`-th dequeued entry.
  // Derived from `seed()` only, so a sequential run is reproducible.
  Rng EntryRng(uint64_t entry_index) const;

  size_t seed() const { return seed_; }
  const std::optional<size_t> &max_parallelism() const {
    return options_.max_parallelism;
  }
  size_t queue_size() const { return queue_.size(); }
  size_t num_seen_coverages() const { return seen_coverages_.size(); }

 private:
  template <typename T>
  static T &NonNull(T *ptr) {
    CHECK(ptr != nullptr);
    return *ptr;
  }

  size_t NumWorkerThreads() const;

  const FuzzerOptions options_;
  const size_t seed_;
  FuzzerPlugins<Input, RawCoverage, Coverage> plugins_;
  TracerGateway<Input, RawCoverage> tracer_;
  WorkQueue<Entry> queue_;
  SeenCoverageSet<Coverage> seen_coverages_;
};

template <typename Input, typename RawCoverage, typename Coverage>
Fuzzer<Input, RawCoverage, Coverage>::Fuzzer(
    FuzzerOptions options, FuzzerPlugins<Input, RawCoverage, Coverage> plugins)
    : options_(std::move(options)),
      seed_(GetRandomSeed(options_.seed)),
      plugins_(std::move(plugins)),
      tracer_(NonNull(plugins_.tracer)) {
  CHECK(plugins_.executor != nullptr);
  CHECK(plugins_.coverage_reader != nullptr);
  CHECK(plugins_.coverage_compressor != nullptr);
  CHECK(plugins_.fault_detector != nullptr);
  CHECK(plugins_.minimizer != nullptr);
  CHECK(plugins_.mutator != nullptr);
  CHECK(plugins_.fault_equality != nullptr);
  if (options_.max_parallelism.has_value()) {
    CHECK_GT(*options_.max_parallelism, 0)
        << "use nullopt for unlimited parallelism";
  }
}

template <typename Input, typename RawCoverage, typename Coverage>
void Fuzzer<Input, RawCoverage, Coverage>::Enqueue(Input input) {
  queue_.Push(Entry{input, std::nullopt});
  tracer_.InputsEnqueued(absl::MakeConstSpan(&input, 1));
}

template <typename Input, typename RawCoverage, typename Coverage>
void Fuzzer<Input, RawCoverage, Coverage>::EnqueueRange(
    std::vector<Input> inputs) {
  std::vector<Entry> entries;
  entries.reserve(inputs.size());
  for (const Input &input : inputs) {
    entries.push_back(Entry{input, std::nullopt});
  }
  queue_.PushRange(std::move(entries));
  tracer_.InputsEnqueued(inputs);
}

template <typename Input, typename RawCoverage, typename Coverage>
void Fuzzer<Input, RawCoverage, Coverage>::Run(
    const CancellationToken &cancellation) {
  const bool sequential = options_.max_parallelism == 1;
  // WARNING!!! The order below is important: the workers use the slots, so
  // they must be joined before the slots are destroyed.
  std::unique_ptr<AdmissionSlots> slots;
  std::unique_ptr<ThreadPool> workers;
  if (!sequential) {
    if (options_.max_parallelism.has_value()) {
      slots = std::make_unique<AdmissionSlots>(*options_.max_parallelism);
    }
    workers = std::make_unique<ThreadPool>(NumWorkerThreads());
  }
  LOG(INFO) << "Starting the fuzzing loop: " << VV(seed_)
            << "max_parallelism: "
            << (options_.max_parallelism.has_value()
                    ? std::to_string(*options_.max_parallelism)
                    : "unlimited")
            << " " << VV(queue_.size());

  // Set the target up before any coverage is collected, so that its one-time
  // initialization is not attributed to the first input.
  plugins_.executor->GlobalInitialize();

  uint64_t num_dequeued = 0;
  while (!cancellation.IsCancelled()) {
    std::optional<Entry> entry = queue_.TryPop();
    if (!entry.has_value()) {
      absl::SleepFor(options_.idle_backoff);
      continue;
    }
    tracer_.InputDequeued(entry->input);
    const uint64_t entry_index = num_dequeued++;
    VLOG(1) << "Dispatching entry " << entry_index << " "
            << VV(queue_.size());

    if (sequential) {
      Rng rng = EntryRng(entry_index);
      ProcessEntry(*std::move(entry), rng);
      continue;
    }
    workers->Schedule([this, entry = *std::move(entry), entry_index,
                       slots = slots.get(), &cancellation]() mutable {
      // Work dispatched without a cap always runs. A capped entry still
      // waiting for a slot is dropped once the run is cancelled.
      if (slots != nullptr && !slots->Acquire(cancellation)) {
        VLOG(1) << "Dropping entry " << entry_index << ": cancelled";
        return;
      }
      absl::Cleanup release_slot = [slots] {
        if (slots != nullptr) slots->Release();
      };
      Rng rng = EntryRng(entry_index);
      ProcessEntry(std::move(entry), rng);
    });
  }

  LOG(INFO) << "Fuzzing loop cancelled after " << num_dequeued
            << " entries: " << VV(queue_.size())
            << VV(seen_coverages_.size());
  if (options_.await_in_flight_on_finish) workers.reset();  // Joins.
  tracer_.FuzzerFinished();
}

template <typename Input, typename RawCoverage, typename Coverage>
typename Fuzzer<Input, RawCoverage, Coverage>::Execution
Fuzzer<Input, RawCoverage, Coverage>::Execute(const Input &input,
                                              bool requeue_on_novelty) {
  const TargetInfo target_info = plugins_.executor->Initialize(input);
  plugins_.coverage_reader->Clear(target_info);
  FaultResult fault =
      plugins_.fault_detector->Detect(*plugins_.executor, target_info);
  if (fault.is_faulted) tracer_.InputFaulted(input, fault);
  const RawCoverage raw_coverage = plugins_.coverage_reader->Read(target_info);
  tracer_.InputFuzzed(input, raw_coverage);

  Execution execution{
      Result{plugins_.coverage_compressor->Compress(raw_coverage),
             std::move(fault)},
      /*is_novel=*/false};
  execution.is_novel = seen_coverages_.InsertIfNovel(execution.result.coverage);
  if (requeue_on_novelty && execution.is_novel) {
    queue_.Push(Entry{input, execution.result});
    tracer_.InputsEnqueued(absl::MakeConstSpan(&input, 1));
  }
  return execution;
}

template <typename Input, typename RawCoverage, typename Coverage>
typename Fuzzer<Input, RawCoverage, Coverage>::Entry
Fuzzer<Input, RawCoverage, Coverage>::Minimize(Entry entry, Rng &rng) {
  // The baseline must not enqueue anything: the entry is already being
  // processed.
  if (!entry.execution_result.has_value()) {
    entry.execution_result =
        Execute(entry.input, /*requeue_on_novelty=*/false).result;
  }
  bool found_smaller = true;
  while (found_smaller) {
    found_smaller = false;
    InputStream<Input> candidates =
        plugins_.minimizer->Minimize(rng, entry.input);
    while (std::optional<Input> candidate = candidates.Next()) {
      // A candidate that turns out to be novel on its own merits is kept in
      // the queue, even though it is not a valid minimization.
      Execution execution = Execute(*candidate);
      if (!AreEquivalent(*entry.execution_result, execution.result)) continue;
      tracer_.MinimizationFound(entry.input, *candidate);
      entry = Entry{*std::move(candidate), std::move(execution.result)};
      found_smaller = true;
      break;
    }
  }
  return entry;
}

template <typename Input, typename RawCoverage, typename Coverage>
void Fuzzer<Input, RawCoverage, Coverage>::Mutate(const Entry &entry,
                                                  Rng &rng) {
  DCHECK(!entry.execution_result.has_value() ||
         !entry.execution_result->fault.is_faulted)
      << "faulted entries must not be mutated";
  InputStream<Input> mutants = plugins_.mutator->Mutate(rng, entry.input);
  while (std::optional<Input> mutant = mutants.Next()) {
    if (Execute(*mutant).is_novel) {
      tracer_.MutationFound(entry.input, *mutant);
    }
  }
}

template <typename Input, typename RawCoverage, typename Coverage>
void Fuzzer<Input, RawCoverage, Coverage>::ProcessEntry(Entry entry,
                                                        Rng &rng) {
  Entry minimized = Minimize(std::move(entry), rng);
  // Faulted inputs are findings, not starting points: don't mutate them.
  if (minimized.execution_result->fault.is_faulted) return;
  Mutate(minimized, rng);
}

template <typename Input, typename RawCoverage, typename Coverage>
bool Fuzzer<Input, RawCoverage, Coverage>::AreEquivalent(
    const Result &a, const Result &b) const {
  return a.coverage == b.coverage &&
         plugins_.fault_equality(a.fault, b.fault);
}

template <typename Input, typename RawCoverage, typename Coverage>
Rng Fuzzer<Input, RawCoverage, Coverage>::EntryRng(
    uint64_t entry_index) const {
  const uint64_t seed = seed_;
  std::seed_seq seed_seq{
      static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
      static_cast<uint32_t>(entry_index),
      static_cast<uint32_t>(entry_index >> 32)};
  return Rng{seed_seq};
}

template <typename Input, typename RawCoverage, typename Coverage>
size_t Fuzzer<Input, RawCoverage, Coverage>::NumWorkerThreads() const {
  if (options_.num_threads != 0) return options_.num_threads;
  return std::max<size_t>(std::thread::hardware_concurrency(), 1);
}

}  // namespace sandpiper

#endif  // SANDPIPER_FUZZER_H_
