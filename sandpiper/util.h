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

// Assorted helpers shared by the engine, the plugins and the tools.

#ifndef SANDPIPER_UTIL_H_
#define SANDPIPER_UTIL_H_

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "./sandpiper/defs.h"

namespace sandpiper {

// If `seed` != 0, returns `seed`, otherwise returns a random number based on
// time, pid, tid, etc.
size_t GetRandomSeed(size_t seed);

// Returns a printable string representing at most `max_len` bytes of `data`.
// Printable characters are kept as is, the rest are shown as `\xAB`.
std::string AsPrintableString(ByteSpan data, size_t max_len = 16);

// Reads the whole file at `file_path` into `data`. `data` is left empty if the
// file does not exist.
void ReadFromLocalFile(std::string_view file_path, ByteArray &data);
void ReadFromLocalFile(std::string_view file_path, std::string &data);

// Writes `data` to `file_path`, replacing any previous contents.
absl::Status WriteToLocalFile(std::string_view file_path, ByteSpan data);
absl::Status WriteToLocalFile(std::string_view file_path,
                              std::string_view data);

// Returns a string that starts with `prefix` and that uniquely identifies
// the caller's process and thread.
std::string ProcessAndThreadUniqueID(std::string_view prefix);

// Returns a path for a temporary local directory, unique to the calling
// process and thread. Does not create the directory.
std::string TemporaryLocalDirPath();

// Creates an empty dir `path` and schedules it for deletion at exit.
// `path` must come from `TemporaryLocalDirPath()`.
void CreateLocalDirRemovedAtExit(std::string_view path);

}  // namespace sandpiper

#endif  // SANDPIPER_UTIL_H_
