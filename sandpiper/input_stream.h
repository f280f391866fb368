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

#ifndef SANDPIPER_INPUT_STREAM_H_
#define SANDPIPER_INPUT_STREAM_H_

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "./sandpiper/defs.h"

namespace sandpiper {

// A lazy, pull-based sequence of values. Values are produced one at a time
// by a generator function until it returns nullopt. A default-constructed
// stream is empty.
//
// The sequence must be finite: the fuzzer drains streams to exhaustion and
// has no way to detect a generator that never ends.
template <typename T>
class InputStream {
 public:
  using Generator = absl::AnyInvocable<std::optional<T>()>;

  InputStream() = default;
  explicit InputStream(Generator generator)
      : generator_(std::move(generator)) {}

  // Movable, not copyable.
  InputStream(InputStream &&) noexcept = default;
  InputStream &operator=(InputStream &&) noexcept = default;

  // A stream over a fixed list of values.
  static InputStream FromVector(std::vector<T> values) {
    return InputStream(
        [values = std::move(values), next = size_t{0}]() mutable
        -> std::optional<T> {
          if (next >= values.size()) return std::nullopt;
          return std::move(values[next++]);
        });
  }

  // Returns the next value, or nullopt once the stream is exhausted. Keeps
  // returning nullopt after that.
  std::optional<T> Next() {
    if (generator_ == nullptr) return std::nullopt;
    std::optional<T> value = generator_();
    if (!value.has_value()) generator_ = nullptr;
    return value;
  }

 private:
  Generator generator_;
};

// Produces simpler variants of an input that the fuzzer tries in order; the
// first one that behaves the same as the input replaces it. Candidates
// should be ordered by preference.
// Implementations must be thread-safe if the fuzzer runs with parallelism
// other than 1; `rng` is owned by the calling worker.
template <typename Input>
class InputMinimizer {
 public:
  virtual ~InputMinimizer() = default;

  // The returned stream is drained while `rng` is alive and may draw from it
  // lazily. It must not refer to `input`: copy what it needs.
  virtual InputStream<Input> Minimize(Rng &rng, const Input &input) = 0;
};

// Produces variants of an input to explore new behavior of the target.
// Same threading rules as `InputMinimizer`.
template <typename Input>
class InputMutator {
 public:
  virtual ~InputMutator() = default;

  // Same lifetime rules as `InputMinimizer::Minimize()`.
  virtual InputStream<Input> Mutate(Rng &rng, const Input &input) = 0;
};

}  // namespace sandpiper

#endif  // SANDPIPER_INPUT_STREAM_H_
