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

// The table dependency analysis of a region: build, reduce and schedule.

#ifndef P4GRAPHS_TDG_ANALYSIS_H_
#define P4GRAPHS_TDG_ANALYSIS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/builder.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/tdg/scheduler.h"

namespace p4graphs::tdg {

struct AnalysisOptions {
  BuildOptions build;
  // Reduce whole-table graphs before scheduling. Ignored for split graphs.
  bool transitive_reduction = true;
  SchedulerOptions scheduler;
};

struct AnalysisResult {
  // The built graph, reduced if requested.
  DependencyGraph graph;
  Schedule schedule;
};

absl::StatusOr<AnalysisResult> AnalyzeTableDependencies(
    const ir::Hlir &hlir, const AnalysisOptions &options);

// Maps a split graph to table granularity: T.match and T.action become T,
// internal edges are dropped and the edges of a pair merged.
absl::StatusOr<DependencyGraph> CollapseToTables(const DependencyGraph &graph);

// Builds the region of `build_options` in both modes and checks that the
// collapsed split graph has the reachability and the stage count of the
// whole-table graph. A mismatch is an InternalError. `build_options.mode` is
// ignored.
absl::Status CheckModeConsistency(const ir::Hlir &hlir,
                                  const BuildOptions &build_options,
                                  const SchedulerOptions &scheduler_options);

}  // namespace p4graphs::tdg

#endif  // P4GRAPHS_TDG_ANALYSIS_H_
