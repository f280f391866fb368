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


#include "./sandpiper/corpus_loader.h"

#include <filesystem>  // NOLINT
#include <string>
#include <string_view>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/test_util.h"
#include "./sandpiper/util.h"

namespace sandpiper {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

ByteArray Bytes(std::string_view str) { return {str.begin(), str.end()}; }

TEST(LoadSeedInputsTest, ReturnsNothingWhenNothingIsGiven) {
  const auto inputs = LoadSeedInputs({}, {});
  ASSERT_OK(inputs.status());
  EXPECT_THAT(*inputs, IsEmpty());
}

TEST(LoadSeedInputsTest, ReadsFilesThenSortedDirContents) {
  TempDir temp_dir{test_info_->name()};
  const std::string dir = temp_dir.CreateSubdir("corpus");
  ASSERT_OK(WriteToLocalFile(dir + "/b", "second"));
  ASSERT_OK(WriteToLocalFile(dir + "/a", "first"));
  ASSERT_OK(WriteToLocalFile(dir + "/c", ""));
  std::filesystem::create_directories(dir + "/nested");
  ASSERT_OK(WriteToLocalFile(dir + "/nested/ignored", "ignored"));
  const std::string file = temp_dir.GetFilePath("single");
  ASSERT_OK(WriteToLocalFile(file, "single"));

  const auto inputs = LoadSeedInputs({file}, {dir});
  ASSERT_OK(inputs.status());
  EXPECT_THAT(*inputs, ElementsAre(Bytes("single"), Bytes("first"),
                                   Bytes("second"), Bytes("")));
}

TEST(LoadSeedInputsTest, MissingPathsAreNotFound) {
  TempDir temp_dir{test_info_->name()};
  EXPECT_EQ(LoadSeedInputs({temp_dir.GetFilePath("nope")}, {}).status().code(),
            absl::StatusCode::kNotFound);
  EXPECT_EQ(LoadSeedInputs({}, {temp_dir.GetFilePath("nope")}).status().code(),
            absl::StatusCode::kNotFound);
}

TEST(LoadSeedInputsTest, RejectsWrongKindsOfPaths) {
  TempDir temp_dir{test_info_->name()};
  const std::string dir = temp_dir.CreateSubdir("dir");
  const std::string file = temp_dir.GetFilePath("file");
  ASSERT_OK(WriteToLocalFile(file, "x"));
  EXPECT_EQ(LoadSeedInputs({dir}, {}).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(LoadSeedInputs({}, {file}).status().code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace sandpiper
