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

#include "p4graphs/graphviz/renderer.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "p4graphs/util/io.h"
#include "p4graphs/util/status.h"
#include "p4graphs/util/status_matchers.h"

namespace p4graphs::graphviz {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Optional;
using ::testing::Return;

class MockGraphRenderer : public GraphRenderer {
 public:
  MOCK_METHOD(absl::Status, Render,
              (const std::string &dot_path, absl::string_view format,
               const std::string &output_path),
              (override));
};

TEST(RenderedPathTest, ReplacesDotExtension) {
  EXPECT_EQ(RenderedPath("out/ingress.tables_dep.dot", "png"),
            "out/ingress.tables_dep.png");
  EXPECT_EQ(RenderedPath("graph", "svg"), "graph.svg");
}

TEST(RenderWithFallbackTest, StopsAtFirstSuccess) {
  MockGraphRenderer renderer;
  {
    InSequence sequence;
    EXPECT_CALL(renderer, Render("g.dot", absl::string_view("svg"), "g.svg"))
        .WillOnce(Return(absl::UnavailableError("no svg")));
    EXPECT_CALL(renderer, Render("g.dot", absl::string_view("png"), "g.png"))
        .WillOnce(Return(absl::OkStatus()));
  }
  std::vector<std::string> formats = {"svg", "png", "pdf"};
  EXPECT_THAT(RenderWithFallback(renderer, "g.dot", formats),
              IsOkAndHolds(Optional(std::string("g.png"))));
}

TEST(RenderWithFallbackTest, NoneKeepsOnlyTheDotFile) {
  MockGraphRenderer renderer;
  EXPECT_CALL(renderer, Render).Times(0);
  std::vector<std::string> formats = {"none", "png"};
  EXPECT_THAT(RenderWithFallback(renderer, "g.dot", formats),
              IsOkAndHolds(std::nullopt));
}

TEST(RenderWithFallbackTest, FailuresBeforeNoneAreTolerated) {
  MockGraphRenderer renderer;
  EXPECT_CALL(renderer, Render(_, absl::string_view("png"), _))
      .WillOnce(Return(absl::UnavailableError("dot not found")));
  std::vector<std::string> formats = {"png", "none"};
  EXPECT_THAT(RenderWithFallback(renderer, "g.dot", formats),
              IsOkAndHolds(std::nullopt));
}

TEST(RenderWithFallbackTest, AllFormatsFailing) {
  MockGraphRenderer renderer;
  EXPECT_CALL(renderer, Render)
      .Times(2)
      .WillRepeatedly(Return(absl::UnavailableError("dot not found")));
  std::vector<std::string> formats = {"png", "svg"};
  absl::Status status =
      RenderWithFallback(renderer, "g.dot", formats).status();
  EXPECT_TRUE(IsRenderingUnavailable(status)) << status;
  EXPECT_THAT(status.message(), HasSubstr("[png, svg]"));
  EXPECT_THAT(status.message(), HasSubstr("dot not found"));
}

TEST(GraphvizRendererTest, MissingExecutableIsUnavailable) {
  GraphvizRenderer renderer("/nonexistent/graphviz/dot");
  absl::Status status = renderer.Render(
      JoinPath(testing::TempDir(), "g.dot"), "png",
      JoinPath(testing::TempDir(), "g.png"));
  EXPECT_TRUE(IsRenderingUnavailable(status)) << status;
  EXPECT_THAT(status.message(), HasSubstr("not found"));
}

TEST(GraphvizRendererTest, FailingExecutableIsUnavailable) {
  GraphvizRenderer renderer("false");
  absl::Status status = renderer.Render(
      JoinPath(testing::TempDir(), "g.dot"), "png",
      JoinPath(testing::TempDir(), "g.png"));
  EXPECT_TRUE(IsRenderingUnavailable(status)) << status;
  EXPECT_THAT(status.message(), HasSubstr("exited with code 1"));
}

}  // namespace
}  // namespace p4graphs::graphviz
