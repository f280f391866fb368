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

#include "./sandpiper/fault.h"

#include <sstream>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace sandpiper {
namespace {

TEST(FaultResultTest, SameFaultKindIgnoresDescription) {
  EXPECT_TRUE(SameFaultKind(FaultResult::NoFault(), FaultResult::NoFault()));
  EXPECT_TRUE(SameFaultKind(FaultResult::Fault("signal:11", "at 0x1234"),
                            FaultResult::Fault("signal:11", "at 0x5678")));
  EXPECT_FALSE(SameFaultKind(FaultResult::Fault("signal:11"),
                             FaultResult::Fault("signal:6")));
  EXPECT_FALSE(
      SameFaultKind(FaultResult::NoFault(), FaultResult::Fault("signal:11")));
}

TEST(FaultResultTest, StructuralEqualityComparesEverything) {
  EXPECT_EQ(FaultResult::Fault("timeout", "x"),
            FaultResult::Fault("timeout", "x"));
  EXPECT_NE(FaultResult::Fault("timeout", "x"),
            FaultResult::Fault("timeout", "y"));
}

TEST(FaultResultTest, FromOkStatusIsNoFault) {
  EXPECT_EQ(FaultFromStatus(absl::OkStatus()), FaultResult::NoFault());
}

TEST(FaultResultTest, FromStatusUsesCodeNameAsKind) {
  const FaultResult fault =
      FaultFromStatus(absl::InternalError("parser blew up"));
  EXPECT_TRUE(fault.is_faulted);
  EXPECT_EQ(fault.kind, "INTERNAL");
  EXPECT_EQ(fault.description, "parser blew up");
}

TEST(FaultResultTest, FromStatusPrefersKindPayload) {
  const FaultResult fault = FaultFromStatus(
      WithFaultKind(absl::AbortedError("killed"), "signal:11"));
  EXPECT_TRUE(fault.is_faulted);
  EXPECT_EQ(fault.kind, "signal:11");
  EXPECT_EQ(fault.description, "killed");
}

TEST(FaultResultTest, Stringifies) {
  std::ostringstream os;
  os << FaultResult::Fault("exit:1", "boom");
  EXPECT_EQ(os.str(), "fault exit:1: boom");
  EXPECT_EQ(absl::StrCat(FaultResult::NoFault()), "no fault");
}

}  // namespace
}  // namespace sandpiper
