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

#include "./sandpiper/util.h"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>  // NOLINT
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>  // NOLINT
#include <thread>        // NOLINT(build/c++11)
#include <vector>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/logging.h"

namespace sandpiper {

namespace {

constexpr std::string_view kTempDirPrefix = "sandpiper-";

template <typename Container>
void ReadFromLocalFileImpl(std::string_view file_path, Container &data) {
  data.clear();
  std::ifstream f(std::string{file_path}, std::ios::binary);
  if (!f) return;
  f.seekg(0, std::ios_base::end);
  const auto size = f.tellg();
  f.seekg(0, std::ios_base::beg);
  data.resize(size);
  f.read(reinterpret_cast<char *>(data.data()), size);
  CHECK(f) << "Failed to read from local file: " << file_path;
}

}  // namespace

size_t GetRandomSeed(size_t seed) {
  if (seed != 0) return seed;
  return time(nullptr) + getpid() +
         std::hash<std::thread::id>{}(std::this_thread::get_id());
}

std::string AsPrintableString(ByteSpan data, size_t max_len) {
  std::ostringstream out;
  const size_t len = std::min(max_len, data.size());
  for (size_t i = 0; i < len; ++i) {
    const auto ch = data[i];
    if (std::isprint(ch)) {
      out << ch;
    } else {
      out << "\\x" << std::uppercase << std::hex << static_cast<uint32_t>(ch)
          << std::nouppercase << std::dec;
    }
  }
  if (data.size() > len) out << "...";
  return out.str();
}

void ReadFromLocalFile(std::string_view file_path, ByteArray &data) {
  ReadFromLocalFileImpl(file_path, data);
}

void ReadFromLocalFile(std::string_view file_path, std::string &data) {
  ReadFromLocalFileImpl(file_path, data);
}

absl::Status WriteToLocalFile(std::string_view file_path, ByteSpan data) {
  std::ofstream f(std::string{file_path}, std::ios::binary | std::ios::trunc);
  if (!f) {
    return absl::UnavailableError(
        absl::StrCat("Failed to open local file: ", file_path));
  }
  f.write(reinterpret_cast<const char *>(data.data()),
          static_cast<std::streamsize>(data.size()));
  f.close();
  if (!f) {
    return absl::DataLossError(
        absl::StrCat("Failed to write to local file: ", file_path));
  }
  return absl::OkStatus();
}

absl::Status WriteToLocalFile(std::string_view file_path,
                              std::string_view data) {
  return WriteToLocalFile(
      file_path,
      ByteSpan(reinterpret_cast<const uint8_t *>(data.data()), data.size()));
}

std::string ProcessAndThreadUniqueID(std::string_view prefix) {
  // operator << is the only way to serialize std::this_thread::get_id().
  std::ostringstream oss;
  oss << prefix << getpid() << "-" << std::this_thread::get_id();
  return oss.str();
}

std::string TemporaryLocalDirPath() {
  const char *tmpdir = std::getenv("TMPDIR");
  const std::filesystem::path tmp = tmpdir != nullptr ? tmpdir : "/tmp";
  return tmp / ProcessAndThreadUniqueID(kTempDirPrefix);
}

// The dirs that CreateLocalDirRemovedAtExit() was called with, removed by an
// atexit handler.
ABSL_CONST_INIT static absl::Mutex dirs_to_delete_at_exit_mutex{
    absl::kConstInit};
static std::vector<std::string> *dirs_to_delete_at_exit
    ABSL_GUARDED_BY(dirs_to_delete_at_exit_mutex);

static void RemoveDirsAtExit() {
  absl::MutexLock lock(&dirs_to_delete_at_exit_mutex);
  for (const auto &dir : *dirs_to_delete_at_exit) {
    std::error_code error;
    std::filesystem::remove_all(dir, error);
  }
}

void CreateLocalDirRemovedAtExit(std::string_view path) {
  // Never remove dirs that TemporaryLocalDirPath() did not name.
  CHECK_NE(path.find(absl::StrCat("/", kTempDirPrefix)), std::string::npos)
      << VV(path);
  std::filesystem::remove_all(path);
  std::filesystem::create_directories(path);
  absl::MutexLock lock(&dirs_to_delete_at_exit_mutex);
  if (dirs_to_delete_at_exit == nullptr) {
    dirs_to_delete_at_exit = new std::vector<std::string>();
    atexit(&RemoveDirsAtExit);
  }
  dirs_to_delete_at_exit->emplace_back(path);
}

}  // namespace sandpiper
