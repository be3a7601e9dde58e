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

#include "p4graphs/graphviz/dot.h"

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "p4graphs/ir/cfg.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/ir/ir.pb.h"
#include "p4graphs/ir/test_util.h"
#include "p4graphs/tdg/analysis.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/tdg/scheduler.h"
#include "p4graphs/util/status.h"
#include "p4graphs/util/status_matchers.h"
#include "p4graphs/util/testing.h"

namespace p4graphs::graphviz {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

// c1 -> (t1 -> t2 | t3). The t3 branch is shorter than the t1 -> t2 one.
constexpr absl::string_view kBranchesProgram = R"pb(
  conditionals {
    name: "c1"
    condition { valid_header: "ipv4" }
    true_next: "t1"
    false_next: "t3"
  }
  tables { name: "t1" actions: "set_a" base_default_next: "t2" }
  tables {
    name: "t2"
    keys {
      field { header: "meta" field: "a" }
      match_type: EXACT
    }
    actions: "nop"
  }
  tables { name: "t3" actions: "nop" }
  pipelines { name: "ingress" initial_control: "c1" }
)pb";

// Analyzes the ingress pipeline of `hlir` and returns its DOT description.
absl::StatusOr<std::string> IngressDot(const ir::Hlir &hlir,
                                       tdg::GraphMode mode,
                                       const DotOptions &options) {
  tdg::AnalysisOptions analysis;
  analysis.build.mode = mode;
  analysis.build.pipeline = "ingress";
  ASSIGN_OR_RETURN(tdg::AnalysisResult result,
                   tdg::AnalyzeTableDependencies(hlir, analysis));
  return DependencyGraphToDot(hlir, result.graph, result.schedule, "ingress",
                              options);
}

TEST(DependencyGraphToDotTest, WholeTableColorsAndStyles) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      IngressDot(*hlir, tdg::GraphMode::kWholeTable, DotOptions()));
  EXPECT_THAT(dot, StartsWith("digraph \"ingress\" {\n"));
  EXPECT_THAT(dot, HasSubstr("  \"t1\" [label=\"t1\"];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"t1\" -> \"t2\" [color=\"red\"];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"t2\" -> \"t3\" [color=gray, "
                             "style=\"dashed\"];\n"));
}

TEST(DependencyGraphToDotTest, ControlFlowEdgesCanBeHidden) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  DotOptions options;
  options.show_control_flow_edges = false;
  ASSERT_OK_AND_ASSIGN(std::string dot,
                       IngressDot(*hlir, tdg::GraphMode::kWholeTable, options));
  EXPECT_THAT(dot, HasSubstr("\"t1\" -> \"t2\""));
  EXPECT_THAT(dot, Not(HasSubstr("\"t2\" -> \"t3\"")));
  // The Event itself is still drawn.
  EXPECT_THAT(dot, HasSubstr("  \"t3\" [label=\"t3\"];\n"));
}

TEST(DependencyGraphToDotTest, FieldsStagesAndWidths) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  DotOptions options;
  options.show_fields = true;
  options.debug_stages = true;
  options.debug_key_result_widths = true;
  ASSERT_OK_AND_ASSIGN(std::string dot,
                       IngressDot(*hlir, tdg::GraphMode::kWholeTable, options));
  EXPECT_THAT(dot, HasSubstr("\"t1\" -> \"t2\" [color=\"red\", "
                             "label=\"{meta.a}\"];"));
  EXPECT_THAT(dot,
              HasSubstr("\"t1\" [label=\"t1\\nstage 0\\nkey 48b, data 8b\"];"));
  EXPECT_THAT(dot,
              HasSubstr("\"t3\" [label=\"t3\\nstage 2\\nkey 16b, data 0b\"];"));
}

TEST(DependencyGraphToDotTest, MultipleDependencyTypesShareAnEdge) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir, ir::ParseHlir(R"pb(
    tables { name: "t1" actions: "set_a" base_default_next: "t2" }
    tables {
      name: "t2"
      keys {
        field { header: "meta" field: "a" }
        match_type: EXACT
      }
      actions: "set_a"
    }
    pipelines { name: "ingress" initial_control: "t1" }
  )pb"));
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      IngressDot(*hlir, tdg::GraphMode::kWholeTable, DotOptions()));
  // MATCH on the key of t2 and ACTION as both write meta.a.
  EXPECT_THAT(dot, HasSubstr("\"t1\" -> \"t2\" [color=\"red:blue\"];"));
}

TEST(DependencyGraphToDotTest, ConditionalsAreDiamonds) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::ConditionalProgram()));
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      IngressDot(*hlir, tdg::GraphMode::kWholeTable, DotOptions()));
  EXPECT_THAT(dot, HasSubstr("  \"c1\" [label=\"c1\", shape=diamond];\n"));

  DotOptions options;
  options.show_condition_text = true;
  ASSERT_OK_AND_ASSIGN(dot,
                       IngressDot(*hlir, tdg::GraphMode::kWholeTable, options));
  EXPECT_THAT(dot, HasSubstr("\"c1\" [label=\"c1\\n(meta.a == 1)\", "
                             "shape=diamond];"));
}

TEST(DependencyGraphToDotTest, SplitGraphMarksCriticalEdges) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  DotOptions options;
  options.show_control_flow_edges = false;
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      IngressDot(*hlir, tdg::GraphMode::kSplitMatchAction, options));
  EXPECT_THAT(dot, HasSubstr("\"t1.action\" -> \"t2.match\" [color=\"red\", "
                             "style=\"bold\"];"));
  // Internal edges are drawn even when control-flow edges are hidden.
  EXPECT_THAT(dot, HasSubstr("\"t1.match\" -> \"t1.action\" [color=gray, "
                             "style=\"dotted,bold\"];"));
  EXPECT_THAT(dot, Not(HasSubstr("\"t2.action\" -> \"t3.match\"")));
}

TEST(DependencyGraphToDotTest, CriticalPathOnly) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(kBranchesProgram));
  DotOptions options;
  options.critical_path_only = true;
  options.debug_stages = true;
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      IngressDot(*hlir, tdg::GraphMode::kSplitMatchAction, options));
  EXPECT_THAT(dot, HasSubstr("\"c1\" -> \"t1.match\" [color=gray, "
                             "style=\"dashed\"];"));
  EXPECT_THAT(dot, HasSubstr("\"t1.action\" -> \"t2.match\" [color=\"red\"];"));
  EXPECT_THAT(dot, Not(HasSubstr("-> \"t3.match\"")));
  EXPECT_THAT(dot, Not(HasSubstr("\"t3.match\" ->")));
  EXPECT_THAT(dot,
              HasSubstr("\"t3.match\" [label=\"t3.match\\nes 0, ls 2\"];"));
}

TEST(DependencyGraphToDotTest, CriticalPathOnlyNeedsSplitGraph) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  DotOptions options;
  options.critical_path_only = true;
  absl::Status status =
      IngressDot(*hlir, tdg::GraphMode::kWholeTable, options).status();
  EXPECT_TRUE(IsConfigurationError(status)) << status;
  EXPECT_OK(ValidateDotOptions(options, tdg::GraphMode::kSplitMatchAction));
}

TEST(DependencyGraphToDotTest, ScheduleMustMatchMode) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::SequentialTablesProgram()));
  tdg::AnalysisOptions analysis;
  analysis.build.pipeline = "ingress";
  ASSERT_OK_AND_ASSIGN(tdg::AnalysisResult result,
                       tdg::AnalyzeTableDependencies(*hlir, analysis));
  tdg::Schedule wrong = tdg::CriticalPath();
  EXPECT_THAT(
      DependencyGraphToDot(*hlir, result.graph, wrong, "ingress", DotOptions()),
      StatusIs(absl::StatusCode::kInternal));
}

TEST(ControlFlowGraphToDotTest, LabelsOutcomes) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::ConditionalProgram()));
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::ControlFlowGraph> cfg,
                       ir::ControlFlowGraph::Create(*hlir, "ingress"));
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      ControlFlowGraphToDot(*hlir, *cfg, "ingress", DotOptions()));
  EXPECT_THAT(dot,
              HasSubstr("  \"$start\" [label=\"ingress\", shape=ellipse];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"$start\" -> \"t1\";\n"));
  EXPECT_THAT(dot, HasSubstr("  \"t1\" -> \"c1\" [label=\"default\"];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"c1\" -> \"t2\" [label=\"true\"];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"c1\" -> \"t3\" [label=\"false\"];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"c1\" [label=\"c1\", shape=diamond];\n"));
}

TEST(ControlFlowGraphToDotTest, TableNamedAfterPipelineKeepsItsNode) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir, ir::ParseHlir(R"pb(
    tables { name: "ingress" actions: "nop" base_default_next: "t2" }
    tables { name: "t2" actions: "nop" }
    pipelines { name: "ingress" initial_control: "ingress" }
  )pb"));
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::ControlFlowGraph> cfg,
                       ir::ControlFlowGraph::Create(*hlir, "ingress"));
  ASSERT_OK_AND_ASSIGN(
      std::string dot,
      ControlFlowGraphToDot(*hlir, *cfg, "ingress", DotOptions()));
  EXPECT_THAT(dot, HasSubstr("  \"$start\" -> \"ingress\";\n"));
  EXPECT_THAT(dot, HasSubstr("  \"ingress\" [label=\"ingress\"];\n"));
  EXPECT_THAT(dot,
              HasSubstr("  \"ingress\" -> \"t2\" [label=\"default\"];\n"));
  EXPECT_THAT(dot, Not(HasSubstr("\"ingress\" [shape=ellipse]")));
}

TEST(ControlFlowGraphToDotTest, WholeProgramHasNoStartNode) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir,
                       ir::ParseHlir(ir::IndependentTablesProgram()));
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::ControlFlowGraph> cfg,
                       ir::ControlFlowGraph::CreateForAllControls(*hlir));
  DotOptions options;
  options.debug_key_result_widths = true;
  ASSERT_OK_AND_ASSIGN(std::string dot,
                       ControlFlowGraphToDot(*hlir, *cfg, "program", options));
  EXPECT_THAT(dot, Not(HasSubstr("ellipse")));
  EXPECT_THAT(dot, HasSubstr("\"t2\" [label=\"t2\\nkey 16b, data 0b\"];"));
  EXPECT_THAT(dot, Not(HasSubstr("->")));
}

TEST(ParserToDotTest, StatesTransitionsAndExits) {
  ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ir::Hlir> hlir,
      ir::ParseHlir(absl::StrCat(ir::SequentialTablesProgram(), R"pb(
        parsers {
          name: "parser"
          initial_state: "start"
          states {
            name: "start"
            extracts: "ethernet"
            select_fields { header: "ethernet" field: "ether_type" }
            transitions { value: "0x0800" next_state: "parse_ipv4" }
            transitions { value: "0x86dd" next_state: "parse_ipv4" }
            transitions { next_state: "t1" }
          }
          states {
            name: "parse_ipv4"
            extracts: "ipv4"
            transitions { next_state: "__END_OF_PARSER__" }
          }
        }
      )pb")));
  ASSERT_OK_AND_ASSIGN(std::string dot, ParserToDot(*hlir, "parser"));
  EXPECT_THAT(dot,
              HasSubstr("  \"$start\" [label=\"parser\", shape=point];\n"));
  EXPECT_THAT(dot, HasSubstr("  \"$start\" -> \"start\";\n"));
  EXPECT_THAT(dot, HasSubstr("\"start\" [label=\"start\\nextract ethernet\\n"
                             "select ethernet.ether_type\"];"));
  EXPECT_THAT(dot, HasSubstr("\"start\" -> \"parse_ipv4\" "
                             "[label=\"0x0800\\n0x86dd\"];"));
  EXPECT_THAT(dot, HasSubstr("\"start\" -> \"t1\" [label=\"default\"];"));
  EXPECT_THAT(dot, HasSubstr("\"__END_OF_PARSER__\" [shape=doublecircle];"));
  EXPECT_THAT(dot, HasSubstr("\"t1\" [shape=box];"));
  EXPECT_THAT(ParserToDot(*hlir, "deparser"),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(ParserToDotTest, StateNamedAfterParserKeepsItsNode) {
  ASSERT_OK_AND_ASSIGN(std::unique_ptr<ir::Hlir> hlir, ir::ParseHlir(R"pb(
    parsers {
      name: "parse"
      initial_state: "parse"
      states {
        name: "parse"
        extracts: "ethernet"
        transitions { next_state: "__END_OF_PARSER__" }
      }
    }
  )pb"));
  ASSERT_OK_AND_ASSIGN(std::string dot, ParserToDot(*hlir, "parse"));
  EXPECT_THAT(dot, HasSubstr("  \"$start\" -> \"parse\";\n"));
  EXPECT_THAT(dot,
              HasSubstr("\"parse\" [label=\"parse\\nextract ethernet\"];"));
  EXPECT_THAT(dot, Not(HasSubstr("\"parse\" [shape=point]")));
}

TEST(DotQuoteTest, EscapesQuotesBackslashesAndNewlines) {
  EXPECT_EQ(DotQuote("t1"), "\"t1\"");
  EXPECT_EQ(DotQuote("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(DotQuote("a\nb"), "\"a\\nb\"");
}

TEST(ExpressionToStringTest, RendersInfix) {
  auto expression = ParseProtoOrDie<ir::Expression>(R"pb(
    binary {
      op: "and"
      left { valid_header: "ipv4" }
      right {
        unary {
          op: "not"
          operand {
            binary {
              op: "=="
              left { field { header: "ipv4" field: "ttl" } }
              right { constant: "0" }
            }
          }
        }
      }
    }
  )pb");
  EXPECT_EQ(ExpressionToString(expression),
            "(valid(ipv4) and not((ipv4.ttl == 0)))");
}

}  // namespace
}  // namespace p4graphs::graphviz
