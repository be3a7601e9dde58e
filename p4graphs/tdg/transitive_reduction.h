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

#ifndef P4GRAPHS_TDG_TRANSITIVE_REDUCTION_H_
#define P4GRAPHS_TDG_TRANSITIVE_REDUCTION_H_

#include "absl/status/statusor.h"
#include "p4graphs/tdg/dependency_graph.h"

namespace p4graphs::tdg {

// Returns a copy of `graph` without the edges implied by other edges, i.e.
// the graph with the fewest edges and the same reachability. Event indices
// are preserved; kept edges keep their kind, types and fields.
//
// Only defined for kWholeTable graphs: in a split graph the internal
// match -> action edges carry the match/action ordering and reducing against
// them would lose dependency information. Returns a ConfigurationError for
// kSplitMatchAction graphs and a CycleError for cyclic graphs.
absl::StatusOr<DependencyGraph> TransitiveReduction(
    const DependencyGraph &graph);

}  // namespace p4graphs::tdg

#endif  // P4GRAPHS_TDG_TRANSITIVE_REDUCTION_H_
