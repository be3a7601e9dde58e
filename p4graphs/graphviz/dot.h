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

// Graphviz DOT descriptions of the dependency graph, the table control flow
// graph and the parse graph of a P4 program.

#ifndef P4GRAPHS_GRAPHVIZ_DOT_H_
#define P4GRAPHS_GRAPHVIZ_DOT_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "p4graphs/ir/cfg.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/ir/ir.pb.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/tdg/scheduler.h"

namespace p4graphs::graphviz {

struct DotOptions {
  // Draw control-flow-only edges. The internal match -> action edges of split
  // tables are always drawn.
  bool show_control_flow_edges = true;
  // Add the condition to the label of conditionals.
  bool show_condition_text = false;
  // Add the field sets to the labels of field-dependency edges.
  bool show_fields = false;
  // Split graphs only: draw the critical edges only.
  bool critical_path_only = false;
  // Add the computed stage, or earliest/latest start, to Event labels.
  bool debug_stages = false;
  // Add the match key and action data widths to table labels.
  bool debug_key_result_widths = false;
};

// Returns a ConfigurationError if `options` cannot be applied to graphs of
// `mode`.
absl::Status ValidateDotOptions(const DotOptions &options, tdg::GraphMode mode);

// Quotes `id` as a DOT string.
std::string DotQuote(absl::string_view id);

// Renders `expression` in P4-like infix syntax.
std::string ExpressionToString(const ir::Expression &expression);

// Returns the DOT description of a dependency graph and its schedule. Edges
// are colored by dependency type: MATCH red, ACTION blue, REVERSE_READ
// orange, control flow gray and dashed. In split graphs the critical edges
// are bold.
absl::StatusOr<std::string> DependencyGraphToDot(
    const ir::Hlir &hlir, const tdg::DependencyGraph &graph,
    const tdg::Schedule &schedule, absl::string_view graph_name,
    const DotOptions &options);

// Returns the DOT description of the table control flow of `pipeline_name`.
// Edges are labeled with the outcomes that take them.
absl::StatusOr<std::string> ControlFlowGraphToDot(
    const ir::Hlir &hlir, const ir::ControlFlowGraph &cfg,
    absl::string_view pipeline_name, const DotOptions &options);

// Returns the DOT description of the parse graph of `parser_name`.
absl::StatusOr<std::string> ParserToDot(const ir::Hlir &hlir,
                                        absl::string_view parser_name);

}  // namespace p4graphs::graphviz

#endif  // P4GRAPHS_GRAPHVIZ_DOT_H_
