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

// Randomized byte-level mutations in the spirit of libFuzzer's
// MutationDispatcher: each mutant is its parent with one random mutation
// applied.

#ifndef SANDPIPER_BYTE_ARRAY_MUTATOR_H_
#define SANDPIPER_BYTE_ARRAY_MUTATOR_H_

#include <cstddef>
#include <vector>

#include "./sandpiper/defs.h"
#include "./sandpiper/input_stream.h"

namespace sandpiper {

class ByteArrayMutator : public InputMutator<ByteArray> {
 public:
  struct Options {
    // Number of mutants produced per `Mutate()` call.
    size_t num_mutants = 16;
    // Mutants never exceed this size. Must be positive.
    size_t max_len = 4096;
  };

  explicit ByteArrayMutator(Options options);

  // Adds `dict_entries` to the dictionary used by `InsertFromDictionary()`.
  // Empty entries are ignored. Not thread-safe: call before fuzzing starts.
  void AddToDictionary(const std::vector<ByteArray> &dict_entries);

  // Lazily yields `num_mutants` mutants of `input`. If `input` is longer than
  // `max_len`, it is truncated first.
  InputStream<ByteArray> Mutate(Rng &rng, const ByteArray &input) override;

  // Applies one randomly chosen mutation to `data`. `data.size()` must not
  // exceed `max_len`.
  void MutateOnce(Rng &rng, ByteArray &data) const;

  // The individual mutations. Each returns false and leaves `data` unchanged
  // if it is not applicable, e.g. because `data` is too short or already at
  // `max_len`.
  bool FlipBit(Rng &rng, ByteArray &data) const;
  bool ChangeByte(Rng &rng, ByteArray &data) const;
  bool InsertByte(Rng &rng, ByteArray &data) const;
  bool EraseBytes(Rng &rng, ByteArray &data) const;
  bool SwapBytes(Rng &rng, ByteArray &data) const;
  bool CopyPart(Rng &rng, ByteArray &data) const;
  bool InsertFromDictionary(Rng &rng, ByteArray &data) const;

  const Options &options() const { return options_; }
  size_t dictionary_size() const { return dictionary_.size(); }

 private:
  const Options options_;
  std::vector<ByteArray> dictionary_;
};

}  // namespace sandpiper

#endif  // SANDPIPER_BYTE_ARRAY_MUTATOR_H_
