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


#ifndef SANDPIPER_SANDPIPER_INTERFACE_H_
#define SANDPIPER_SANDPIPER_INTERFACE_H_

#include "absl/status/status.h"
#include "./sandpiper/environment.h"
#include "./sandpiper/stats.h"

namespace sandpiper {

// Fuzzes `env.binary` out of process until the run is interrupted (SIGINT)
// or `env.stop_after` elapses, updating `stats` as it goes. Installs the
// SIGINT and SIGALRM handlers. Returns an error if `env` is invalid or the
// seed corpus can't be loaded, OK otherwise, including after an interrupt:
// check `EarlyExitRequested()` and `ExitCode()` for that.
absl::Status Fuzz(const Environment &env, FuzzerStats &stats);

// The main entry point of the `sandpiper` binary. Returns EXIT_SUCCESS if
// the run ended on its own terms, EXIT_FAILURE if it was misconfigured or
// interrupted with Ctrl-C.
int SandpiperMain(const Environment &env);

}  // namespace sandpiper

#endif  // SANDPIPER_SANDPIPER_INTERFACE_H_
