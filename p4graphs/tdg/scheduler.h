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

// Stage scheduling of dependency graphs. A whole-table graph is scheduled by
// counting the minimum number of pipeline stages; a split match/action graph
// by computing the full set of critical (zero slack) Events and edges.

#ifndef P4GRAPHS_TDG_SCHEDULER_H_
#define P4GRAPHS_TDG_SCHEDULER_H_

#include <utility>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "p4graphs/tdg/dependency_graph.h"

namespace p4graphs::tdg {

struct SchedulerOptions {
  // If set, conditionals occupy a stage like tables do. Otherwise they are
  // free.
  bool count_conditionals = false;
  // If set, the stage of every Event is logged.
  bool debug_stages = false;
};

// Number of stages `event` occupies: 1, or 0 for conditionals unless they are
// counted.
int EventCost(const Event &event, const SchedulerOptions &options);

struct StageAssignment {
  // Minimum number of stages needed to run all Events in dependency order.
  int num_stages = 0;
  // The earliest stage of every Event, indexed by EventId.
  std::vector<int> stage;
  // Events by stage, each list in index order.
  std::vector<std::vector<EventId>> events_by_stage;
};

struct CriticalPath {
  // Length of the longest path, in stages.
  int length = 0;
  // Earliest and latest start of every Event, indexed by EventId.
  std::vector<int> earliest_start;
  std::vector<int> latest_start;
  // Events with zero slack, in index order.
  std::vector<EventId> events;
  // Dependency edges on a longest path, ordered by source then target. The
  // internal match -> action edges of split tables are not listed.
  std::vector<std::pair<EventId, EventId>> edges;

  bool IsCriticalEvent(EventId id) const {
    return earliest_start[id] == latest_start[id];
  }
  bool IsCriticalEdge(EventId source, EventId target) const;
};

using Schedule = std::variant<StageAssignment, CriticalPath>;

// Assigns every Event its earliest stage: sources start at stage 0 and an
// Event starts once all its predecessors are done. Linear in the size of the
// graph. Returns a CycleError if the graph is cyclic.
absl::StatusOr<StageAssignment> CountMinStages(const DependencyGraph &graph,
                                               const SchedulerOptions &options);

// Computes the earliest and latest start of every Event and reports every
// Event and edge on a longest path. Returns a CycleError if the graph is
// cyclic.
absl::StatusOr<CriticalPath> ComputeCriticalPath(
    const DependencyGraph &graph, const SchedulerOptions &options);

// Schedules `graph` according to its mode: a StageAssignment for
// kWholeTable graphs, a CriticalPath for kSplitMatchAction graphs.
absl::StatusOr<Schedule> ScheduleStages(const DependencyGraph &graph,
                                        const SchedulerOptions &options);

// Number of stages of a schedule: the stage count or the critical-path
// length.
int NumStages(const Schedule &schedule);

}  // namespace p4graphs::tdg

#endif  // P4GRAPHS_TDG_SCHEDULER_H_
