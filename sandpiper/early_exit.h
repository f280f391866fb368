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

#ifndef SANDPIPER_EARLY_EXIT_H_
#define SANDPIPER_EARLY_EXIT_H_

#include "./sandpiper/cancellation.h"

namespace sandpiper {

// Requests that the process winds down its fuzzing run soon and then exits
// with `exit_code`. Cancels `EarlyExitToken()`.
// Async-signal-safe.
void RequestEarlyExit(int exit_code);

// Clears the request to exit early and un-cancels `EarlyExitToken()`.
//
// Note: Typically it doesn't make much sense to concurrently both request early
// exit and clear the request, so the normal usage is to invoke this function
// before starting a run that may invoke the other related functions.
void ClearEarlyExitRequest();

// Returns true iff `RequestEarlyExit()` was called since the most recent call
// to `ClearEarlyExitRequest()` (if any).
bool EarlyExitRequested();

// Returns the value most recently passed to `RequestEarlyExit()` or 0 if
// `RequestEarlyExit()` was not called since the most recent call to
// `ClearEarlyExitRequest()` (if any).
int ExitCode();

// The process-wide token cancelled by `RequestEarlyExit()`. Pass it to
// `Fuzzer::Run()` to make the run responsive to signals.
const CancellationToken &EarlyExitToken();

}  // namespace sandpiper

#endif  // SANDPIPER_EARLY_EXIT_H_
