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

#include "./sandpiper/byte_array_mutator.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/input_stream.h"

namespace sandpiper {

namespace {

// Returns a random number in [0, n). `n` must be positive.
size_t RandomIndex(Rng &rng, size_t n) { return rng() % n; }

}  // namespace

ByteArrayMutator::ByteArrayMutator(Options options) : options_(options) {
  CHECK_GT(options_.max_len, 0);
  CHECK_GT(options_.num_mutants, 0);
}

void ByteArrayMutator::AddToDictionary(
    const std::vector<ByteArray> &dict_entries) {
  for (const ByteArray &entry : dict_entries) {
    if (!entry.empty()) dictionary_.push_back(entry);
  }
}

InputStream<ByteArray> ByteArrayMutator::Mutate(Rng &rng,
                                                const ByteArray &input) {
  ByteArray parent(input.begin(),
                   input.begin() + std::min(input.size(), options_.max_len));
  return InputStream<ByteArray>(
      [this, &rng, parent = std::move(parent),
       remaining = options_.num_mutants]() mutable -> std::optional<ByteArray> {
        if (remaining == 0) return std::nullopt;
        --remaining;
        ByteArray mutant = parent;
        MutateOnce(rng, mutant);
        return mutant;
      });
}

void ByteArrayMutator::MutateOnce(Rng &rng, ByteArray &data) const {
  DCHECK_LE(data.size(), options_.max_len);
  using Mutation = bool (ByteArrayMutator::*)(Rng &, ByteArray &) const;
  static constexpr Mutation kMutations[] = {
      &ByteArrayMutator::FlipBit,    &ByteArrayMutator::ChangeByte,
      &ByteArrayMutator::InsertByte, &ByteArrayMutator::EraseBytes,
      &ByteArrayMutator::SwapBytes,  &ByteArrayMutator::CopyPart,
      &ByteArrayMutator::InsertFromDictionary,
  };
  constexpr size_t kNumMutations = sizeof(kMutations) / sizeof(kMutations[0]);
  // With `max_len` > 0, either InsertByte (short data) or FlipBit (non-empty
  // data) applies, so this loop ends.
  while (true) {
    const Mutation mutation = kMutations[RandomIndex(rng, kNumMutations)];
    if ((this->*mutation)(rng, data)) return;
  }
}

bool ByteArrayMutator::FlipBit(Rng &rng, ByteArray &data) const {
  if (data.empty()) return false;
  const size_t bit = RandomIndex(rng, data.size() * 8);
  data[bit / 8] ^= 1 << (bit % 8);
  return true;
}

bool ByteArrayMutator::ChangeByte(Rng &rng, ByteArray &data) const {
  if (data.empty()) return false;
  const size_t index = RandomIndex(rng, data.size());
  // Never a no-op: add a non-zero value modulo 256.
  data[index] += 1 + RandomIndex(rng, 255);
  return true;
}

bool ByteArrayMutator::InsertByte(Rng &rng, ByteArray &data) const {
  if (data.size() >= options_.max_len) return false;
  const size_t index = RandomIndex(rng, data.size() + 1);
  data.insert(data.begin() + index, static_cast<uint8_t>(rng()));
  return true;
}

bool ByteArrayMutator::EraseBytes(Rng &rng, ByteArray &data) const {
  if (data.empty()) return false;
  const size_t num_bytes = RandomIndex(rng, (data.size() + 1) / 2) + 1;
  const size_t index = RandomIndex(rng, data.size() - num_bytes + 1);
  data.erase(data.begin() + index, data.begin() + index + num_bytes);
  return true;
}

bool ByteArrayMutator::SwapBytes(Rng &rng, ByteArray &data) const {
  if (data.size() < 2) return false;
  const size_t first = RandomIndex(rng, data.size());
  size_t second = RandomIndex(rng, data.size() - 1);
  if (second >= first) ++second;
  if (data[first] == data[second]) return false;
  std::swap(data[first], data[second]);
  return true;
}

bool ByteArrayMutator::CopyPart(Rng &rng, ByteArray &data) const {
  if (data.size() < 2) return false;
  // Copies data[from, from + size) over data[to, to + size).
  const size_t from = RandomIndex(rng, data.size());
  const size_t to = RandomIndex(rng, data.size());
  if (from == to) return false;
  const size_t max_size = data.size() - std::max(from, to);
  const size_t size = RandomIndex(rng, max_size) + 1;
  const ByteArray part(data.begin() + from, data.begin() + from + size);
  if (std::equal(part.begin(), part.end(), data.begin() + to)) return false;
  std::copy(part.begin(), part.end(), data.begin() + to);
  return true;
}

bool ByteArrayMutator::InsertFromDictionary(Rng &rng, ByteArray &data) const {
  if (dictionary_.empty()) return false;
  const ByteArray &word = dictionary_[RandomIndex(rng, dictionary_.size())];
  if (data.size() + word.size() > options_.max_len) return false;
  const size_t index = RandomIndex(rng, data.size() + 1);
  data.insert(data.begin() + index, word.begin(), word.end());
  return true;
}

}  // namespace sandpiper
