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

// Runs the target as a separate process per input.
//
// Protocol with the target binary:
//   * The input is written to a file. Every "@@" in the argument list is
//     replaced by that file's path; if no argument contains "@@", the path
//     is appended as the last argument.
//   * The environment variable SANDPIPER_COVERAGE_FILE names a file the
//     target should write its raw 8-bit counters to, one byte per location.
//     A target that writes nothing reports empty coverage.
//   * A run faults if the process is killed by a signal (kind "signal:N"),
//     exits with a non-zero code (kind "exit:N"), or runs past the timeout
//     (kind "timeout").

#ifndef SANDPIPER_COMMAND_TARGET_H_
#define SANDPIPER_COMMAND_TARGET_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/coverage.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/target.h"

namespace sandpiper {

inline constexpr std::string_view kInputPathPlaceholder = "@@";
inline constexpr std::string_view kCoverageFileEnvVar =
    "SANDPIPER_COVERAGE_FILE";

class CommandTarget : public TargetExecutor<ByteArray>,
                      public CoverageReader<CoverageCounters> {
 public:
  struct Options {
    // Path to the target binary.
    std::string binary;
    // Arguments passed to `binary`.
    std::vector<std::string> args = {std::string(kInputPathPlaceholder)};
    // Runs longer than this are killed and reported as faults.
    absl::Duration timeout = absl::Seconds(10);
    // Where per-run files are created. Empty means a fresh temporary
    // directory, removed at exit.
    std::string work_dir;
  };

  explicit CommandTarget(Options options);

  TargetInfo Initialize(const ByteArray &input) override;
  absl::Status Execute(const TargetInfo &target_info) override;

  void Clear(const TargetInfo &target_info) override;
  CoverageCounters Read(const TargetInfo &target_info) override;

  // Returns the command line for a run whose input is at `input_path`.
  std::vector<std::string> CommandLine(std::string_view input_path) const;

  const std::string &work_dir() const { return work_dir_; }

 private:
  const Options options_;
  std::string work_dir_;
  std::atomic<uint64_t> next_run_id_ = 0;
};

}  // namespace sandpiper

#endif  // SANDPIPER_COMMAND_TARGET_H_
