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

#include "p4graphs/tdg/analysis.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/ir/test_util.h"
#include "p4graphs/tdg/builder.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/tdg/scheduler.h"
#include "p4graphs/util/status.h"
#include "p4graphs/util/status_matchers.h"

namespace p4graphs::tdg {
namespace {

using ::testing::NotNull;

AnalysisOptions IngressAnalysis(GraphMode mode) {
  AnalysisOptions options;
  options.build.mode = mode;
  options.build.pipeline = "ingress";
  return options;
}

TEST(AnalyzeTableDependenciesTest, ReducesWholeTableGraphs) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::TransitiveProgram()));
  ASSERT_OK_AND_ASSIGN(
      AnalysisResult result,
      AnalyzeTableDependencies(*hlir, IngressAnalysis(GraphMode::kWholeTable)));
  EXPECT_EQ(result.graph.num_edges(), 2);
  ASSERT_TRUE(std::holds_alternative<StageAssignment>(result.schedule));
  EXPECT_EQ(NumStages(result.schedule), 3);
}

TEST(AnalyzeTableDependenciesTest, ReductionCanBeDisabled) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::TransitiveProgram()));
  AnalysisOptions options = IngressAnalysis(GraphMode::kWholeTable);
  options.transitive_reduction = false;
  ASSERT_OK_AND_ASSIGN(AnalysisResult result,
                       AnalyzeTableDependencies(*hlir, options));
  EXPECT_EQ(result.graph.num_edges(), 3);
  EXPECT_EQ(NumStages(result.schedule), 3);
}

TEST(AnalyzeTableDependenciesTest, SplitGraphsAreNotReduced) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  ASSERT_OK_AND_ASSIGN(AnalysisResult result,
                       AnalyzeTableDependencies(
                           *hlir,
                           IngressAnalysis(GraphMode::kSplitMatchAction)));
  EXPECT_EQ(result.graph.num_edges(), 5);
  ASSERT_TRUE(std::holds_alternative<CriticalPath>(result.schedule));
  EXPECT_EQ(std::get<CriticalPath>(result.schedule).length, 6);
}

TEST(AnalyzeTableDependenciesTest, ConditionalsCanBeCounted) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::ConditionalProgram()));
  AnalysisOptions options = IngressAnalysis(GraphMode::kWholeTable);
  ASSERT_OK_AND_ASSIGN(AnalysisResult free,
                       AnalyzeTableDependencies(*hlir, options));
  EXPECT_EQ(NumStages(free.schedule), 2);
  options.scheduler.count_conditionals = true;
  ASSERT_OK_AND_ASSIGN(AnalysisResult counted,
                       AnalyzeTableDependencies(*hlir, options));
  EXPECT_EQ(NumStages(counted.schedule), 3);
}

TEST(CollapseToTablesTest, MergesHalvesOfSplitTables) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::ConditionalProgram()));
  BuildOptions options;
  options.mode = GraphMode::kSplitMatchAction;
  options.pipeline = "ingress";
  ASSERT_OK_AND_ASSIGN(DependencyGraph split,
                       BuildDependencyGraph(*hlir, options));
  ASSERT_OK_AND_ASSIGN(DependencyGraph collapsed, CollapseToTables(split));
  EXPECT_EQ(collapsed.mode(), GraphMode::kWholeTable);
  EXPECT_EQ(collapsed.num_events(), 4);
  EXPECT_EQ(collapsed.num_edges(), 3);

  std::optional<EventId> c1 = collapsed.FindEvent("c1");
  std::optional<EventId> t1 = collapsed.FindEvent("t1");
  ASSERT_TRUE(c1.has_value());
  ASSERT_TRUE(t1.has_value());
  EXPECT_EQ(collapsed.event(*c1).kind, EventKind::kConditional);
  EXPECT_EQ(collapsed.event(*t1).kind, EventKind::kTable);
  const Dependency *t1_c1 = collapsed.FindDependency(*t1, *c1);
  ASSERT_THAT(t1_c1, NotNull());
  EXPECT_EQ(t1_c1->kind, EdgeKind::kFieldDependency);
}

TEST(CheckModeConsistencyTest, FixturesAgreeAcrossModes) {
  for (const std::string &program :
       {ir::SequentialTablesProgram(), ir::ConditionalProgram(),
        ir::TransitiveProgram(), ir::DiamondProgram()}) {
    ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                         ir::ParseHlir(program));
    BuildOptions options;
    options.pipeline = "ingress";
    EXPECT_OK(CheckModeConsistency(*hlir, options, SchedulerOptions()));
    SchedulerOptions counted;
    counted.count_conditionals = true;
    EXPECT_OK(CheckModeConsistency(*hlir, options, counted));
  }
}

TEST(CheckModeConsistencyTest, WholeProgram) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::IndependentTablesProgram()));
  EXPECT_OK(CheckModeConsistency(*hlir, BuildOptions(), SchedulerOptions()));
}

TEST(CheckModeConsistencyTest, PropagatesBuildErrors) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  BuildOptions options;
  options.pipeline = "egress";
  EXPECT_THAT(CheckModeConsistency(*hlir, options, SchedulerOptions()),
              StatusIs(absl::StatusCode::kNotFound));
}

}  // namespace
}  // namespace p4graphs::tdg
