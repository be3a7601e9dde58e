// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "p4graphs/util/io.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "p4graphs/util/status_matchers.h"

namespace p4graphs {
namespace {

using ::testing::HasSubstr;

TEST(IoTest, WriteThenReadFile) {
  const std::string path = JoinPath(testing::TempDir(), "io_test.txt");
  ASSERT_OK(WriteFile("digraph {}\n", path));
  EXPECT_THAT(ReadFile(path), IsOkAndHolds(std::string("digraph {}\n")));
}

TEST(IoTest, ReadMissingFileFails) {
  EXPECT_THAT(ReadFile(JoinPath(testing::TempDir(), "does_not_exist")),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(IoTest, TempDirIsValidOutputDirectory) {
  EXPECT_OK(ValidateOutputDirectory(testing::TempDir()));
}

TEST(IoTest, MissingOutputDirectoryIsConfigurationError) {
  absl::Status status = ValidateOutputDirectory(
      JoinPath(testing::TempDir(), "no/such/directory"));
  EXPECT_TRUE(IsConfigurationError(status)) << status;
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument,
                               HasSubstr("does not exist")));
}

TEST(IoTest, RegularFileIsNotAnOutputDirectory) {
  const std::string path = JoinPath(testing::TempDir(), "regular_file");
  ASSERT_OK(WriteFile("", path));
  EXPECT_THAT(ValidateOutputDirectory(path),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not a directory")));
}

TEST(IoTest, EmptyOutputDirectoryIsConfigurationError) {
  EXPECT_TRUE(IsConfigurationError(ValidateOutputDirectory("")));
}

TEST(IoTest, JoinPathUsesExactlyOneSeparator) {
  EXPECT_EQ(JoinPath("out", "a.dot"), "out/a.dot");
  EXPECT_EQ(JoinPath("out/", "a.dot"), "out/a.dot");
  EXPECT_EQ(JoinPath("", "a.dot"), "a.dot");
}

TEST(IoTest, PlainFileNames) {
  EXPECT_TRUE(IsPlainFileName("ingress"));
  EXPECT_TRUE(IsPlainFileName("..ingress"));
  EXPECT_FALSE(IsPlainFileName(""));
  EXPECT_FALSE(IsPlainFileName("."));
  EXPECT_FALSE(IsPlainFileName(".."));
  EXPECT_FALSE(IsPlainFileName("../ingress"));
  EXPECT_FALSE(IsPlainFileName("/tmp/ingress"));
  EXPECT_FALSE(IsPlainFileName(absl::string_view("in\0gress", 8)));
}

}  // namespace
}  // namespace p4graphs
