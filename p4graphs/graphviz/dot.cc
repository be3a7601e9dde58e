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

#include <string>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "p4graphs/ir/cfg.h"
#include "p4graphs/ir/fields.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/tdg/scheduler.h"
#include "p4graphs/util/status.h"

namespace p4graphs::graphviz {

namespace {

constexpr absl::string_view kMatchColor = "red";
constexpr absl::string_view kActionColor = "blue";
constexpr absl::string_view kReverseReadColor = "orange";
constexpr absl::string_view kControlFlowColor = "gray";

// Id of the synthetic node a pipeline or parser starts from. Names starting
// with '$' are reserved, so no control or parse state can use it.
constexpr absl::string_view kStartNode = "$start";

// Returns a quoted label with one line per entry of `lines`.
std::string Label(const std::vector<std::string> &lines) {
  std::vector<std::string> escaped;
  for (const std::string &line : lines) {
    std::string quoted = DotQuote(line);
    escaped.push_back(quoted.substr(1, quoted.size() - 2));
  }
  return absl::StrCat("\"", absl::StrJoin(escaped, "\\n"), "\"");
}

absl::string_view DependencyTypeColor(tdg::DependencyType type) {
  switch (type) {
    case tdg::DependencyType::kMatch:
      return kMatchColor;
    case tdg::DependencyType::kAction:
      return kActionColor;
    case tdg::DependencyType::kReverseRead:
      return kReverseReadColor;
  }
  return kControlFlowColor;
}

std::string ConditionText(const ir::Conditional &conditional) {
  if (!conditional.source_text().empty()) return conditional.source_text();
  return ExpressionToString(conditional.condition());
}

// The stage annotation of `id`, if the schedule provides one.
std::string StageText(const tdg::Schedule &schedule, tdg::EventId id) {
  if (const auto *stages = std::get_if<tdg::StageAssignment>(&schedule)) {
    return absl::StrCat("stage ", stages->stage[id]);
  }
  const auto &path = std::get<tdg::CriticalPath>(schedule);
  return absl::StrCat("es ", path.earliest_start[id], ", ls ",
                      path.latest_start[id]);
}

// Key and action data widths relevant to `event`.
std::string WidthText(const ir::Hlir &hlir, const tdg::Event &event) {
  const ir::Hlir::TableInfo *table = hlir.tables().Find(event.control);
  if (table == nullptr) return "";
  switch (event.kind) {
    case tdg::EventKind::kMatch:
      return absl::StrCat("key ", table->key_width, "b");
    case tdg::EventKind::kAction:
      return absl::StrCat("data ", table->action_data_width, "b");
    case tdg::EventKind::kTable:
      return absl::StrCat("key ", table->key_width, "b, data ",
                          table->action_data_width, "b");
    case tdg::EventKind::kConditional:
      break;
  }
  return "";
}

// True for edges that lie on a longest path, internal edges included.
bool IsOnCriticalPath(const tdg::CriticalPath &path,
                      const tdg::DependencyEdge &edge) {
  if (!edge.dependency->internal) {
    return path.IsCriticalEdge(edge.source, edge.target);
  }
  // The match Event of a table always costs one stage.
  return path.IsCriticalEvent(edge.source) &&
         path.IsCriticalEvent(edge.target) &&
         path.earliest_start[edge.source] + 1 ==
             path.earliest_start[edge.target];
}

}  // namespace

absl::Status ValidateDotOptions(const DotOptions &options,
                                tdg::GraphMode mode) {
  if (options.critical_path_only && mode != tdg::GraphMode::kSplitMatchAction) {
    return ConfigurationErrorBuilder()
           << "Drawing only the critical path requires split match/action "
              "graphs.";
  }
  return absl::OkStatus();
}

std::string DotQuote(absl::string_view id) {
  std::string quoted = "\"";
  for (char c : id) {
    if (c == '"' || c == '\\') quoted.push_back('\\');
    if (c == '\n') {
      quoted.append("\\n");
      continue;
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string ExpressionToString(const ir::Expression &expression) {
  switch (expression.value_case()) {
    case ir::Expression::kField:
      return ir::QualifiedFieldName(expression.field());
    case ir::Expression::kConstant:
      return expression.constant();
    case ir::Expression::kBoolean:
      return expression.boolean() ? "true" : "false";
    case ir::Expression::kValidHeader:
      return absl::StrCat("valid(", expression.valid_header(), ")");
    case ir::Expression::kUnary:
      return absl::StrCat(expression.unary().op(), "(",
                          ExpressionToString(expression.unary().operand()),
                          ")");
    case ir::Expression::kBinary:
      return absl::StrCat("(", ExpressionToString(expression.binary().left()),
                          " ", expression.binary().op(), " ",
                          ExpressionToString(expression.binary().right()),
                          ")");
    case ir::Expression::VALUE_NOT_SET:
      break;
  }
  return "";
}

absl::StatusOr<std::string> DependencyGraphToDot(
    const ir::Hlir &hlir, const tdg::DependencyGraph &graph,
    const tdg::Schedule &schedule, absl::string_view graph_name,
    const DotOptions &options) {
  RETURN_IF_ERROR(ValidateDotOptions(options, graph.mode()));
  const auto *critical_path = std::get_if<tdg::CriticalPath>(&schedule);
  RET_CHECK((critical_path != nullptr) ==
            (graph.mode() == tdg::GraphMode::kSplitMatchAction))
      << ": schedule does not match the graph mode.";

  std::string out = absl::StrCat("digraph ", DotQuote(graph_name), " {\n");
  absl::StrAppend(&out, "  node [shape=box];\n");

  for (tdg::EventId id = 0; id < graph.num_events(); ++id) {
    const tdg::Event &event = graph.event(id);
    std::vector<std::string> lines = {event.name};
    std::string attributes;
    if (event.kind == tdg::EventKind::kConditional) {
      attributes = ", shape=diamond";
      if (options.show_condition_text) {
        const ir::Hlir::ConditionalInfo &conditional =
            *hlir.conditionals().Find(event.control);
        lines.push_back(ConditionText(*conditional.conditional));
      }
    }
    if (options.debug_stages) lines.push_back(StageText(schedule, id));
    if (options.debug_key_result_widths) {
      std::string widths = WidthText(hlir, event);
      if (!widths.empty()) lines.push_back(widths);
    }
    absl::StrAppend(&out, "  ", DotQuote(event.name), " [label=", Label(lines),
                    attributes, "];\n");
  }

  for (const tdg::DependencyEdge &edge : graph.edges()) {
    const tdg::Dependency &dependency = *edge.dependency;
    const bool control_flow = dependency.kind == tdg::EdgeKind::kControlFlow;
    if (control_flow && !dependency.internal &&
        !options.show_control_flow_edges) {
      continue;
    }
    const bool critical = critical_path != nullptr &&
                          IsOnCriticalPath(*critical_path, edge);
    if (options.critical_path_only && !critical) continue;

    std::vector<std::string> attributes;
    std::vector<std::string> styles;
    if (control_flow) {
      attributes.push_back(absl::StrCat("color=", kControlFlowColor));
      styles.push_back(dependency.internal ? "dotted" : "dashed");
    } else {
      std::vector<absl::string_view> colors;
      for (tdg::DependencyType type : dependency.types) {
        colors.push_back(DependencyTypeColor(type));
      }
      attributes.push_back(
          absl::StrCat("color=\"", absl::StrJoin(colors, ":"), "\""));
      if (options.show_fields) {
        attributes.push_back(
            absl::StrCat("label=", Label({ir::ToString(dependency.fields)})));
      }
    }
    if (critical && !options.critical_path_only) styles.push_back("bold");
    if (!styles.empty()) {
      attributes.push_back(
          absl::StrCat("style=\"", absl::StrJoin(styles, ","), "\""));
    }
    absl::StrAppend(&out, "  ", DotQuote(graph.event(edge.source).name),
                    " -> ", DotQuote(graph.event(edge.target).name), " [",
                    absl::StrJoin(attributes, ", "), "];\n");
  }
  absl::StrAppend(&out, "}\n");
  return out;
}

absl::StatusOr<std::string> ControlFlowGraphToDot(
    const ir::Hlir &hlir, const ir::ControlFlowGraph &cfg,
    absl::string_view pipeline_name, const DotOptions &options) {
  std::string out = absl::StrCat("digraph ", DotQuote(pipeline_name), " {\n");
  absl::StrAppend(&out, "  node [shape=box];\n");

  if (const ir::Pipeline *const *pipeline =
          hlir.pipelines().Find(pipeline_name);
      pipeline != nullptr) {
    const std::string &initial_control = (*pipeline)->initial_control();
    absl::StrAppend(&out, "  ", DotQuote(kStartNode),
                    " [label=", Label({std::string(pipeline_name)}),
                    ", shape=ellipse];\n");
    if (!ir::IsEndOfPipeline(initial_control)) {
      absl::StrAppend(&out, "  ", DotQuote(kStartNode), " -> ",
                      DotQuote(initial_control), ";\n");
    }
  }

  for (const std::string &control : cfg.topological_order()) {
    std::vector<std::string> lines = {control};
    std::string attributes;
    if (const ir::Hlir::ConditionalInfo *conditional =
            hlir.conditionals().Find(control);
        conditional != nullptr) {
      attributes = ", shape=diamond";
      if (options.show_condition_text) {
        lines.push_back(ConditionText(*conditional->conditional));
      }
    } else if (options.debug_key_result_widths) {
      const ir::Hlir::TableInfo &table = *hlir.tables().Find(control);
      lines.push_back(absl::StrCat("key ", table.key_width, "b, data ",
                                   table.action_data_width, "b"));
    }
    absl::StrAppend(&out, "  ", DotQuote(control), " [label=", Label(lines),
                    attributes, "];\n");
  }

  for (const std::string &control : cfg.topological_order()) {
    ASSIGN_OR_RETURN(const ir::CfgNode *node, cfg.GetNode(control));
    for (const auto &[child, labels] : node->child_labels) {
      absl::StrAppend(&out, "  ", DotQuote(control), " -> ", DotQuote(child),
                      " [label=",
                      Label({absl::StrJoin(labels, "\n")}), "];\n");
    }
  }
  absl::StrAppend(&out, "}\n");
  return out;
}

absl::StatusOr<std::string> ParserToDot(const ir::Hlir &hlir,
                                        absl::string_view parser_name) {
  const ir::Parser *const *found = hlir.parsers().Find(parser_name);
  if (found == nullptr) {
    return NotFoundErrorBuilder() << "Unknown parser '" << parser_name << "'.";
  }
  const ir::Parser &parser = **found;

  std::string out = absl::StrCat("digraph ", DotQuote(parser_name), " {\n");
  absl::StrAppend(&out, "  node [shape=ellipse];\n");
  absl::StrAppend(&out, "  ", DotQuote(kStartNode), " [label=",
                  Label({std::string(parser_name)}), ", shape=point];\n");
  absl::StrAppend(&out, "  ", DotQuote(kStartNode), " -> ",
                  DotQuote(parser.initial_state()), ";\n");

  // Transition targets outside the parser: its end, or the first control of
  // the ingress pipeline.
  absl::btree_set<std::string> exits;
  absl::btree_set<std::string> states;
  for (const ir::ParseState &state : parser.states()) {
    states.insert(state.name());
  }
  if (!states.contains(parser.initial_state())) {
    exits.insert(parser.initial_state());
  }

  for (const ir::ParseState &state : parser.states()) {
    std::vector<std::string> lines = {state.name()};
    if (!state.extracts().empty()) {
      lines.push_back(
          absl::StrCat("extract ", absl::StrJoin(state.extracts(), ", ")));
    }
    if (!state.select_fields().empty()) {
      std::vector<std::string> fields;
      for (const ir::FieldRef &field : state.select_fields()) {
        fields.push_back(ir::QualifiedFieldName(field));
      }
      lines.push_back(absl::StrCat("select ", absl::StrJoin(fields, ", ")));
    }
    absl::StrAppend(&out, "  ", DotQuote(state.name()),
                    " [label=", Label(lines), "];\n");

    // Merge the transitions to the same state into one edge.
    absl::btree_map<std::string, std::vector<std::string>> labels_by_target;
    for (const ir::ParserTransition &transition : state.transitions()) {
      std::string label = transition.value().empty() ? "default"
                                                     : transition.value();
      if (!transition.mask().empty()) {
        absl::StrAppend(&label, " &&& ", transition.mask());
      }
      labels_by_target[transition.next_state()].push_back(std::move(label));
      if (!states.contains(transition.next_state())) {
        exits.insert(transition.next_state());
      }
    }
    for (const auto &[target, labels] : labels_by_target) {
      absl::StrAppend(&out, "  ", DotQuote(state.name()), " -> ",
                      DotQuote(target), " [label=",
                      Label({absl::StrJoin(labels, "\n")}), "];\n");
    }
  }

  for (const std::string &exit : exits) {
    absl::StrAppend(&out, "  ", DotQuote(exit),
                    exit == ir::EndOfParser() ? " [shape=doublecircle];\n"
                                              : " [shape=box];\n");
  }
  absl::StrAppend(&out, "}\n");
  return out;
}

}  // namespace p4graphs::graphviz
