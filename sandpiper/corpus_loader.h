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


// Loading of seed inputs from the local file system.

#ifndef SANDPIPER_CORPUS_LOADER_H_
#define SANDPIPER_CORPUS_LOADER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "./sandpiper/defs.h"

namespace sandpiper {

// Reads every file in `files`, then every regular file directly inside each
// of `dirs`, and returns their contents in that order. Files of a directory
// are visited in lexicographic path order, so the result does not depend on
// the file system's enumeration order.
//
// Returns NotFound if a file or directory does not exist, and
// InvalidArgument if an entry of `files` is not a regular file or an entry of
// `dirs` is not a directory.
absl::StatusOr<std::vector<ByteArray>> LoadSeedInputs(
    const std::vector<std::string> &files,
    const std::vector<std::string> &dirs);

}  // namespace sandpiper

#endif  // SANDPIPER_CORPUS_LOADER_H_
