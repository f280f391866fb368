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

#include "./sandpiper/in_process_target.h"

#include <memory>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/logging.h"
#include "./sandpiper/target.h"

namespace sandpiper {

InProcessTarget::InProcessTarget(Callback callback,
                                 GlobalInitializer global_initializer)
    : callback_(std::move(callback)),
      global_initializer_(std::move(global_initializer)) {
  CHECK(callback_ != nullptr);
}

void InProcessTarget::GlobalInitialize() {
  if (global_initializer_ == nullptr) return;
  VLOG(1) << "Running the global initializer of the in-process target";
  global_initializer_();
}

TargetInfo InProcessTarget::Initialize(const ByteArray &input) {
  auto run = std::make_shared<Run>();
  run->input = input;
  return TargetInfo{next_run_id_++, std::move(run)};
}

absl::Status InProcessTarget::Execute(const TargetInfo &target_info) {
  Run &run = target_info.state<Run>();
  return callback_(run.input, run.counters);
}

void InProcessTarget::Clear(const TargetInfo &target_info) {
  target_info.state<Run>().counters.Clear();
}

CoverageCounters InProcessTarget::Read(const TargetInfo &target_info) {
  return target_info.state<Run>().counters;
}

}  // namespace sandpiper
