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

#include <cstdlib>

#include "gtest/gtest.h"

namespace sandpiper {
namespace {

TEST(EarlyExitTest, RequestCancelsTokenAndRecordsExitCode) {
  ClearEarlyExitRequest();
  EXPECT_FALSE(EarlyExitRequested());
  EXPECT_FALSE(EarlyExitToken().IsCancelled());
  EXPECT_EQ(ExitCode(), 0);

  RequestEarlyExit(EXIT_FAILURE);
  EXPECT_TRUE(EarlyExitRequested());
  EXPECT_TRUE(EarlyExitToken().IsCancelled());
  EXPECT_EQ(ExitCode(), EXIT_FAILURE);

  ClearEarlyExitRequest();
  EXPECT_FALSE(EarlyExitRequested());
  EXPECT_FALSE(EarlyExitToken().IsCancelled());
  EXPECT_EQ(ExitCode(), 0);
}

}  // namespace
}  // namespace sandpiper
