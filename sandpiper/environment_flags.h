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


#ifndef SANDPIPER_ENVIRONMENT_FLAGS_H_
#define SANDPIPER_ENVIRONMENT_FLAGS_H_

#include "./sandpiper/environment.h"

namespace sandpiper {

// Returns an `Environment` populated from the current values of the command
// line flags. Call after `absl::ParseCommandLine()`.
Environment CreateEnvironmentFromFlags();

}  // namespace sandpiper

#endif  // SANDPIPER_ENVIRONMENT_FLAGS_H_
