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

#include "./sandpiper/command_target.h"

#include <filesystem>  // NOLINT
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "./sandpiper/counters.h"
#include "./sandpiper/defs.h"
#include "./sandpiper/fault.h"
#include "./sandpiper/target.h"
#include "./sandpiper/test_util.h"
#include "./sandpiper/util.h"

namespace sandpiper {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

ByteArray AsBytes(std::string_view str) {
  return ByteArray(str.begin(), str.end());
}

// A target that runs `script` with the input path as $1.
CommandTarget::Options ShellTarget(std::string script,
                                   const TempDir &work_dir) {
  return {
      .binary = "/bin/sh",
      .args = {"-c", std::move(script), "sh", "@@"},
      .timeout = absl::Seconds(10),
      .work_dir = work_dir.path().string(),
  };
}

FaultResult Detect(CommandTarget &target, const ByteArray &input) {
  StatusFaultDetector<ByteArray> detector;
  return detector.Detect(target, target.Initialize(input));
}

TEST(CommandTargetTest, CommandLineSubstitutesInputPath) {
  CommandTarget with_placeholder{
      {.binary = "bin", .args = {"--in=@@", "-v"}, .work_dir = "/tmp"}};
  EXPECT_THAT(with_placeholder.CommandLine("/x/in"),
              ElementsAre("bin", "--in=/x/in", "-v"));

  CommandTarget without_placeholder{
      {.binary = "bin", .args = {"-v"}, .work_dir = "/tmp"}};
  EXPECT_THAT(without_placeholder.CommandLine("/x/in"),
              ElementsAre("bin", "-v", "/x/in"));

  CommandTarget default_args{{.binary = "bin", .work_dir = "/tmp"}};
  EXPECT_THAT(default_args.CommandLine("/x/in"), ElementsAre("bin", "/x/in"));
}

TEST(CommandTargetTest, MapsTerminationToFaults) {
  TempDir work_dir{test_info_->name()};
  CommandTarget target{ShellTarget(R"sh(
    input=$(cat "$1")
    case "$input" in
      ok) exit 0 ;;
      exit) echo "bad input" >&2; exit 3 ;;
      segv) kill -SEGV $$ ;;
    esac
  )sh",
                                   work_dir)};
  EXPECT_EQ(Detect(target, AsBytes("ok")), FaultResult::NoFault());
  const FaultResult exited = Detect(target, AsBytes("exit"));
  EXPECT_TRUE(exited.is_faulted);
  EXPECT_EQ(exited.kind, "exit:3");
  EXPECT_THAT(exited.description, HasSubstr("bad input"));
  EXPECT_EQ(Detect(target, AsBytes("segv")).kind, "signal:11");
}

TEST(CommandTargetTest, TimeoutIsAFault) {
  TempDir work_dir{test_info_->name()};
  CommandTarget::Options options = ShellTarget("sleep 30", work_dir);
  options.timeout = absl::Milliseconds(500);
  CommandTarget target{options};
  EXPECT_EQ(Detect(target, {}).kind, "timeout");
}

TEST(CommandTargetTest, MissingBinaryIsAFault) {
  TempDir work_dir{test_info_->name()};
  CommandTarget target{
      {.binary = "/no/such/binary", .work_dir = work_dir.path().string()}};
  EXPECT_EQ(Detect(target, {}).kind, "spawn");
}

TEST(CommandTargetTest, ReadsCoverageDump) {
  TempDir work_dir{test_info_->name()};
  CommandTarget target{ShellTarget(
      R"sh(printf '\001\000\003' > "$SANDPIPER_COVERAGE_FILE")sh", work_dir)};
  const TargetInfo info = target.Initialize({});
  target.Clear(info);
  EXPECT_TRUE(target.Execute(info).ok());
  EXPECT_EQ(target.Read(info), (CoverageCounters{ByteArray{1, 0, 3}}));
}

TEST(CommandTargetTest, MissingDumpIsEmptyCoverageAndClearRemovesStaleDump) {
  TempDir work_dir{test_info_->name()};
  CommandTarget target{ShellTarget("true", work_dir)};
  const TargetInfo info = target.Initialize({});
  EXPECT_EQ(target.Read(info), CoverageCounters{});

  // Plant a dump left over from an earlier run with the same id.
  const std::string coverage_path =
      (work_dir.path() / absl::StrCat("coverage-", info.run_id())).string();
  ASSERT_OK(WriteToLocalFile(coverage_path, ByteArray{5}));
  EXPECT_EQ(target.Read(info), CoverageCounters{ByteArray{5}});
  target.Clear(info);
  EXPECT_TRUE(target.Execute(info).ok());
  EXPECT_EQ(target.Read(info), CoverageCounters{});
}

TEST(CommandTargetTest, RunFilesAreRemovedWithTargetInfo) {
  TempDir work_dir{test_info_->name()};
  CommandTarget target{ShellTarget(
      R"sh(printf '\001' > "$SANDPIPER_COVERAGE_FILE")sh", work_dir)};
  {
    const TargetInfo info = target.Initialize(AsBytes("input"));
    EXPECT_TRUE(target.Execute(info).ok());
    EXPECT_FALSE(std::filesystem::is_empty(work_dir.path()));
  }
  EXPECT_TRUE(std::filesystem::is_empty(work_dir.path()));
}

TEST(CommandTargetTest, CreatesOwnWorkDir) {
  CommandTarget first{{.binary = "true"}};
  CommandTarget second{{.binary = "true"}};
  EXPECT_NE(first.work_dir(), second.work_dir());
  EXPECT_TRUE(std::filesystem::is_directory(first.work_dir()));
  EXPECT_TRUE(std::filesystem::is_directory(second.work_dir()));
}

}  // namespace
}  // namespace sandpiper
