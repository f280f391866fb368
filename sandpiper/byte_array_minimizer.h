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

#ifndef SANDPIPER_BYTE_ARRAY_MINIMIZER_H_
#define SANDPIPER_BYTE_ARRAY_MINIMIZER_H_

#include "./sandpiper/defs.h"
#include "./sandpiper/input_stream.h"

namespace sandpiper {

// Shrinks byte arrays by removing chunks. For an input of size `n`, yields
// the input with one chunk removed, for chunk sizes `n/2, n/4, ..., 1` and,
// for each size, every chunk-aligned offset. Larger removals come first, so
// the fuzzer's first-match-wins policy prefers them. Deterministic: `rng` is
// not used.
class ByteArrayMinimizer : public InputMinimizer<ByteArray> {
 public:
  InputStream<ByteArray> Minimize(Rng &rng, const ByteArray &input) override;
};

}  // namespace sandpiper

#endif  // SANDPIPER_BYTE_ARRAY_MINIMIZER_H_
