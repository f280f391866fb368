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

#include "./sandpiper/command_target.h"

#include <atomic>
#include <cstddef>
#include <filesystem>  // NOLINT
#include <memory>
#include <string>
#include <string_view>
#include <system_error>  // NOLINT
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/time/time.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/logging.h"
#include "./sandpiper/subprocess.h"
#include "./sandpiper/target.h"
#include "./sandpiper/util.h"

namespace sandpiper {

namespace {

// Keeps fault descriptions short: the tail of stderr is where sanitizers and
// assertion failures print.
constexpr size_t kMaxDescriptionSize = 4096;

std::string Tail(std::string_view str) {
  if (str.size() <= kMaxDescriptionSize) return std::string(str);
  return std::string(str.substr(str.size() - kMaxDescriptionSize));
}

// The files of one run. They are removed once the last `TargetInfo` copy
// referring to the run goes away.
struct RunFiles {
  std::string input_path;
  std::string coverage_path;

  ~RunFiles() {
    std::error_code error;
    std::filesystem::remove(input_path, error);
    std::filesystem::remove(coverage_path, error);
  }
};

std::string NewWorkDir() {
  static std::atomic<int> num_work_dirs = 0;
  std::string dir =
      absl::StrCat(TemporaryLocalDirPath(), "-target-", num_work_dirs++);
  CreateLocalDirRemovedAtExit(dir);
  return dir;
}

}  // namespace

CommandTarget::CommandTarget(Options options)
    : options_(std::move(options)),
      work_dir_(options_.work_dir.empty() ? NewWorkDir() : options_.work_dir) {
  CHECK(!options_.binary.empty());
  VLOG(1) << "Running " << options_.binary << " with files in " << work_dir_;
}

std::vector<std::string> CommandTarget::CommandLine(
    std::string_view input_path) const {
  std::vector<std::string> command_line = {options_.binary};
  bool has_placeholder = false;
  for (const std::string &arg : options_.args) {
    if (absl::StrContains(arg, kInputPathPlaceholder)) has_placeholder = true;
    command_line.push_back(
        absl::StrReplaceAll(arg, {{kInputPathPlaceholder, input_path}}));
  }
  if (!has_placeholder) command_line.emplace_back(input_path);
  return command_line;
}

TargetInfo CommandTarget::Initialize(const ByteArray &input) {
  const uint64_t run_id = next_run_id_++;
  auto files = std::make_shared<RunFiles>();
  const std::filesystem::path work_dir = work_dir_;
  files->input_path = (work_dir / absl::StrCat("input-", run_id)).string();
  files->coverage_path =
      (work_dir / absl::StrCat("coverage-", run_id)).string();
  const absl::Status written = WriteToLocalFile(files->input_path, input);
  CHECK(written.ok()) << "Cannot write the input for run " << run_id << ": "
                      << written;
  return TargetInfo{run_id, std::move(files)};
}

absl::Status CommandTarget::Execute(const TargetInfo &target_info) {
  const RunFiles &files = target_info.state<RunFiles>();
  absl::StatusOr<RunResults> results = RunCommand(
      CommandLine(files.input_path),
      {{std::string(kCoverageFileEnvVar), files.coverage_path}},
      options_.timeout);
  if (!results.ok()) {
    LOG(ERROR) << "Run " << target_info.run_id()
               << " did not start: " << results.status();
    return WithFaultKind(results.status(), "spawn");
  }
  VLOG(3) << "Run " << target_info.run_id() << ": " << results->status
          << VV(results->stdout_output) << VV(results->stderr_output);
  if (results->timed_out) {
    return WithFaultKind(
        absl::DeadlineExceededError(
            absl::StrCat("Timed out after ", absl::FormatDuration(
                                                 options_.timeout))),
        "timeout");
  }
  if (results->status.Signaled()) {
    return WithFaultKind(absl::InternalError(Tail(results->stderr_output)),
                         absl::StrCat("signal:", results->status.signal()));
  }
  if (results->status.exit_code() != 0) {
    return WithFaultKind(absl::InternalError(Tail(results->stderr_output)),
                         absl::StrCat("exit:", results->status.exit_code()));
  }
  return absl::OkStatus();
}

void CommandTarget::Clear(const TargetInfo &target_info) {
  std::error_code error;
  std::filesystem::remove(target_info.state<RunFiles>().coverage_path, error);
}

CoverageCounters CommandTarget::Read(const TargetInfo &target_info) {
  ByteArray counters;
  ReadFromLocalFile(target_info.state<RunFiles>().coverage_path, counters);
  return CoverageCounters{std::move(counters)};
}

}  // namespace sandpiper
