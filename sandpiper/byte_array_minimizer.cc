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

#include "./sandpiper/byte_array_minimizer.h"

#include <algorithm>
#include <cstddef>
#include <optional>

#include "./sandpiper/defs.h"
#include "./sandpiper/input_stream.h"

namespace sandpiper {

InputStream<ByteArray> ByteArrayMinimizer::Minimize(Rng &rng,
                                                    const ByteArray &input) {
  if (input.empty()) return InputStream<ByteArray>();
  return InputStream<ByteArray>(
      [input = input, chunk_size = std::max<size_t>(input.size() / 2, 1),
       offset = size_t{0}]() mutable -> std::optional<ByteArray> {
        if (offset >= input.size()) {
          chunk_size /= 2;
          offset = 0;
        }
        if (chunk_size == 0) return std::nullopt;
        const size_t end = std::min(offset + chunk_size, input.size());
        ByteArray candidate;
        candidate.reserve(input.size() - (end - offset));
        candidate.insert(candidate.end(), input.begin(),
                         input.begin() + offset);
        candidate.insert(candidate.end(), input.begin() + end, input.end());
        offset += chunk_size;
        return candidate;
      });
}

}  // namespace sandpiper
