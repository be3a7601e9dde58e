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

#include "p4graphs/tdg/scheduler.h"

#include <algorithm>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/util/overload.h"
#include "p4graphs/util/status.h"

namespace p4graphs::tdg {

namespace {

// Earliest start of every Event, in a single pass over `order`.
std::vector<int> EarliestStarts(const DependencyGraph &graph,
                                const std::vector<EventId> &order,
                                const SchedulerOptions &options) {
  std::vector<int> earliest_start(graph.num_events(), 0);
  for (EventId v : order) {
    const int done = earliest_start[v] + EventCost(graph.event(v), options);
    for (const DependencyEdge &edge : graph.out_edges(v)) {
      earliest_start[edge.target] = std::max(earliest_start[edge.target], done);
    }
  }
  return earliest_start;
}

}  // namespace

int EventCost(const Event &event, const SchedulerOptions &options) {
  if (event.kind == EventKind::kConditional && !options.count_conditionals) {
    return 0;
  }
  return 1;
}

bool CriticalPath::IsCriticalEdge(EventId source, EventId target) const {
  return std::binary_search(edges.begin(), edges.end(),
                            std::make_pair(source, target));
}

absl::StatusOr<StageAssignment> CountMinStages(
    const DependencyGraph &graph, const SchedulerOptions &options) {
  ASSIGN_OR_RETURN(std::vector<EventId> order, graph.TopologicalOrder());

  StageAssignment result;
  result.stage = EarliestStarts(graph, order, options);
  int last_stage = -1;
  for (EventId v = 0; v < graph.num_events(); ++v) {
    result.num_stages =
        std::max(result.num_stages,
                 result.stage[v] + EventCost(graph.event(v), options));
    last_stage = std::max(last_stage, result.stage[v]);
  }
  result.events_by_stage.resize(last_stage + 1);
  for (EventId v = 0; v < graph.num_events(); ++v) {
    result.events_by_stage[result.stage[v]].push_back(v);
  }

  if (options.debug_stages) {
    for (int stage = 0; stage < result.events_by_stage.size(); ++stage) {
      LOG(INFO) << "Stage " << stage << ": "
                << absl::StrJoin(result.events_by_stage[stage], ", ",
                                 [&graph](std::string *out, EventId id) {
                                   out->append(graph.event(id).name);
                                 });
    }
  }
  VLOG(1) << "Minimum number of stages: " << result.num_stages;
  return result;
}

absl::StatusOr<CriticalPath> ComputeCriticalPath(
    const DependencyGraph &graph, const SchedulerOptions &options) {
  ASSIGN_OR_RETURN(std::vector<EventId> order, graph.TopologicalOrder());
  const int n = graph.num_events();

  CriticalPath result;
  result.earliest_start = EarliestStarts(graph, order, options);
  for (EventId v = 0; v < n; ++v) {
    result.length =
        std::max(result.length,
                 result.earliest_start[v] + EventCost(graph.event(v), options));
  }

  // Backward pass. A sink must be done by the end of the longest path.
  result.latest_start.assign(n, 0);
  for (auto v = order.rbegin(); v != order.rend(); ++v) {
    const int cost = EventCost(graph.event(*v), options);
    int finish = result.length;
    for (const DependencyEdge &edge : graph.out_edges(*v)) {
      finish = std::min(finish, result.latest_start[edge.target]);
    }
    result.latest_start[*v] = finish - cost;
  }

  for (EventId v = 0; v < n; ++v) {
    if (result.IsCriticalEvent(v)) result.events.push_back(v);
    if (options.debug_stages) {
      LOG(INFO) << graph.event(v).name
                << ": earliest start " << result.earliest_start[v]
                << ", latest start " << result.latest_start[v];
    }
  }
  for (const DependencyEdge &edge : graph.edges()) {
    if (edge.dependency->internal) continue;
    if (result.IsCriticalEvent(edge.source) &&
        result.IsCriticalEvent(edge.target) &&
        result.earliest_start[edge.source] +
                EventCost(graph.event(edge.source), options) ==
            result.earliest_start[edge.target]) {
      result.edges.push_back({edge.source, edge.target});
    }
  }
  std::sort(result.edges.begin(), result.edges.end());
  result.edges.erase(std::unique(result.edges.begin(), result.edges.end()),
                     result.edges.end());
  VLOG(1) << "Critical path length: " << result.length << ", "
          << result.edges.size() << " critical edges.";
  return result;
}

absl::StatusOr<Schedule> ScheduleStages(const DependencyGraph &graph,
                                        const SchedulerOptions &options) {
  switch (graph.mode()) {
    case GraphMode::kWholeTable: {
      ASSIGN_OR_RETURN(StageAssignment stages, CountMinStages(graph, options));
      return Schedule(std::move(stages));
    }
    case GraphMode::kSplitMatchAction: {
      ASSIGN_OR_RETURN(CriticalPath path, ComputeCriticalPath(graph, options));
      return Schedule(std::move(path));
    }
  }
  return InternalErrorBuilder() << "Unknown graph mode.";
}

int NumStages(const Schedule &schedule) {
  return std::visit(
      Overload{
          [](const StageAssignment &stages) { return stages.num_stages; },
          [](const CriticalPath &path) { return path.length; },
      },
      schedule);
}

}  // namespace p4graphs::tdg
