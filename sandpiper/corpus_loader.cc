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


#include "./sandpiper/corpus_loader.h"

#include <algorithm>
#include <filesystem>  // NOLINT
#include <string>
#include <system_error>  // NOLINT
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/logging.h"
#include "./sandpiper/util.h"

namespace sandpiper {

namespace {

absl::Status CheckExists(const std::filesystem::path &path) {
  std::error_code error;
  if (!std::filesystem::exists(path, error)) {
    return absl::NotFoundError(absl::StrCat("No such path: ", path.string()));
  }
  return absl::OkStatus();
}

absl::Status AppendFile(const std::filesystem::path &path,
                        std::vector<ByteArray> &inputs) {
  if (auto status = CheckExists(path); !status.ok()) return status;
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a regular file: ", path.string()));
  }
  ByteArray &input = inputs.emplace_back();
  ReadFromLocalFile(path.string(), input);
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::vector<ByteArray>> LoadSeedInputs(
    const std::vector<std::string> &files,
    const std::vector<std::string> &dirs) {
  std::vector<ByteArray> inputs;
  for (const auto &file : files) {
    if (auto status = AppendFile(file, inputs); !status.ok()) return status;
  }
  for (const auto &dir : dirs) {
    if (auto status = CheckExists(dir); !status.ok()) return status;
    std::error_code error;
    if (!std::filesystem::is_directory(dir, error)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Not a directory: ", dir));
    }
    std::vector<std::filesystem::path> paths;
    for (const auto &entry : std::filesystem::directory_iterator(dir, error)) {
      if (entry.is_regular_file()) paths.push_back(entry.path());
    }
    if (error) {
      return absl::UnavailableError(
          absl::StrCat("Failed to list ", dir, ": ", error.message()));
    }
    std::sort(paths.begin(), paths.end());
    for (const auto &path : paths) {
      if (auto status = AppendFile(path, inputs); !status.ok()) return status;
    }
    VLOG(1) << "Loaded " << paths.size() << " seed input(s) from " << dir;
  }
  return inputs;
}

}  // namespace sandpiper
