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

#include "./sandpiper/early_exit.h"

#include <atomic>
#include <cstdlib>

#include "./sandpiper/cancellation.h"

namespace sandpiper {
namespace {

std::atomic<int> early_exit_code = EXIT_SUCCESS;

CancellationToken &MutableEarlyExitToken() {
  // Never destroyed: signal handlers may touch it during process teardown.
  static auto *token = new CancellationToken();
  return *token;
}

// Force construction before any signal handler can run.
[[maybe_unused]] const CancellationToken &early_exit_token_init =
    MutableEarlyExitToken();

}  // namespace

void RequestEarlyExit(int exit_code) {
  // The code must be visible to whoever observes the cancellation.
  early_exit_code.store(exit_code, std::memory_order_relaxed);
  MutableEarlyExitToken().Cancel();
}

void ClearEarlyExitRequest() {
  early_exit_code.store(EXIT_SUCCESS, std::memory_order_relaxed);
  MutableEarlyExitToken().Reset();
}

bool EarlyExitRequested() { return MutableEarlyExitToken().IsCancelled(); }

int ExitCode() {
  if (!EarlyExitRequested()) return 0;
  return early_exit_code.load(std::memory_order_relaxed);
}

const CancellationToken &EarlyExitToken() { return MutableEarlyExitToken(); }

}  // namespace sandpiper
