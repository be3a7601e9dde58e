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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boost/dynamic_bitset.hpp"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/builder.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/tdg/scheduler.h"
#include "p4graphs/tdg/transitive_reduction.h"
#include "p4graphs/util/status.h"

namespace p4graphs::tdg {

absl::StatusOr<AnalysisResult> AnalyzeTableDependencies(
    const ir::Hlir &hlir, const AnalysisOptions &options) {
  ASSIGN_OR_RETURN(DependencyGraph graph,
                   BuildDependencyGraph(hlir, options.build));
  RETURN_IF_ERROR(graph.ValidateInvariants());
  if (options.transitive_reduction &&
      graph.mode() == GraphMode::kWholeTable) {
    ASSIGN_OR_RETURN(graph, TransitiveReduction(graph));
  }
  VLOG(1) << graph.ToString();
  ASSIGN_OR_RETURN(Schedule schedule,
                   ScheduleStages(graph, options.scheduler));
  return AnalysisResult{std::move(graph), std::move(schedule)};
}

absl::StatusOr<DependencyGraph> CollapseToTables(const DependencyGraph &graph) {
  DependencyGraph collapsed(GraphMode::kWholeTable);
  std::vector<EventId> table_of(graph.num_events());
  for (EventId id = 0; id < graph.num_events(); ++id) {
    const Event &event = graph.event(id);
    if (std::optional<EventId> existing = collapsed.FindEvent(event.control)) {
      table_of[id] = *existing;
      continue;
    }
    Event table;
    table.name = event.control;
    table.kind = event.kind == EventKind::kConditional ? EventKind::kConditional
                                                       : EventKind::kTable;
    table.control = event.control;
    ASSIGN_OR_RETURN(table_of[id], collapsed.AddEvent(std::move(table)));
  }
  for (const DependencyEdge &edge : graph.edges()) {
    if (edge.dependency->internal) continue;
    RET_CHECK(table_of[edge.source] != table_of[edge.target])
        << ": non-internal edge within '" << graph.event(edge.source).control
        << "'.";
    RETURN_IF_ERROR(collapsed.AddDependency(
        table_of[edge.source], table_of[edge.target], *edge.dependency));
  }
  return collapsed;
}

absl::Status CheckModeConsistency(const ir::Hlir &hlir,
                                  const BuildOptions &build_options,
                                  const SchedulerOptions &scheduler_options) {
  BuildOptions whole_table_options = build_options;
  whole_table_options.mode = GraphMode::kWholeTable;
  ASSIGN_OR_RETURN(DependencyGraph whole_table,
                   BuildDependencyGraph(hlir, whole_table_options));
  BuildOptions split_options = build_options;
  split_options.mode = GraphMode::kSplitMatchAction;
  ASSIGN_OR_RETURN(DependencyGraph split,
                   BuildDependencyGraph(hlir, split_options));
  ASSIGN_OR_RETURN(DependencyGraph collapsed, CollapseToTables(split));

  RET_CHECK(collapsed.num_events() == whole_table.num_events())
      << ": the split graph has " << collapsed.num_events()
      << " controls, the whole-table graph " << whole_table.num_events();
  ASSIGN_OR_RETURN(std::vector<boost::dynamic_bitset<>> expected,
                   whole_table.ComputeDescendants());
  ASSIGN_OR_RETURN(std::vector<boost::dynamic_bitset<>> actual,
                   collapsed.ComputeDescendants());
  for (EventId from = 0; from < whole_table.num_events(); ++from) {
    const std::string &from_name = whole_table.event(from).name;
    std::optional<EventId> collapsed_from = collapsed.FindEvent(from_name);
    RET_CHECK(collapsed_from.has_value())
        << ": '" << from_name << "' is missing from the split graph.";
    for (EventId to = 0; to < whole_table.num_events(); ++to) {
      const std::string &to_name = whole_table.event(to).name;
      std::optional<EventId> collapsed_to = collapsed.FindEvent(to_name);
      RET_CHECK(collapsed_to.has_value())
          << ": '" << to_name << "' is missing from the split graph.";
      const bool reachable = expected[from].test(to);
      if (reachable != actual[*collapsed_from].test(*collapsed_to)) {
        return InternalErrorBuilder()
               << "'" << to_name << "' is " << (reachable ? "" : "not ")
               << "reachable from '" << from_name
               << "' in the whole-table graph, but the split graph disagrees.";
      }
    }
  }

  ASSIGN_OR_RETURN(StageAssignment expected_stages,
                   CountMinStages(whole_table, scheduler_options));
  ASSIGN_OR_RETURN(StageAssignment collapsed_stages,
                   CountMinStages(collapsed, scheduler_options));
  if (expected_stages.num_stages != collapsed_stages.num_stages) {
    return InternalErrorBuilder()
           << "The whole-table graph needs " << expected_stages.num_stages
           << " stages, the collapsed split graph "
           << collapsed_stages.num_stages << ".";
  }
  ASSIGN_OR_RETURN(CriticalPath critical_path,
                   ComputeCriticalPath(split, scheduler_options));
  LOG(INFO) << "Modes agree on " << expected_stages.num_stages
            << " stages; the split critical path is " << critical_path.length
            << " long.";
  return absl::OkStatus();
}

}  // namespace p4graphs::tdg
