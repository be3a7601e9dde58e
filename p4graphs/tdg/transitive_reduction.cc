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

#include "p4graphs/tdg/transitive_reduction.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boost/dynamic_bitset.hpp"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/util/status.h"

namespace p4graphs::tdg {

absl::StatusOr<DependencyGraph> TransitiveReduction(
    const DependencyGraph &graph) {
  if (graph.mode() != GraphMode::kWholeTable) {
    return ConfigurationErrorBuilder()
           << "Transitive reduction requires a "
           << GraphModeName(GraphMode::kWholeTable) << " graph, got "
           << GraphModeName(graph.mode()) << ".";
  }
  ASSIGN_OR_RETURN(std::vector<EventId> order, graph.TopologicalOrder());
  const int n = graph.num_events();
  std::vector<int> position(n);
  for (int i = 0; i < n; ++i) position[order[i]] = i;

  // descendants[v] holds the Events reachable from v through kept edges,
  // which is all Events reachable from v.
  std::vector<boost::dynamic_bitset<>> descendants(n,
                                                   boost::dynamic_bitset<>(n));
  std::vector<DependencyEdge> kept;
  for (auto v = order.rbegin(); v != order.rend(); ++v) {
    std::vector<DependencyEdge> out = graph.out_edges(*v);
    // Closer successors first: a successor can only be reached through
    // successors earlier in topological order.
    std::stable_sort(out.begin(), out.end(),
                     [&position](const DependencyEdge &a,
                                 const DependencyEdge &b) {
                       return position[a.target] < position[b.target];
                     });
    for (const DependencyEdge &edge : out) {
      if (descendants[*v].test(edge.target)) continue;
      kept.push_back(edge);
      descendants[*v].set(edge.target);
      descendants[*v] |= descendants[edge.target];
    }
  }
  std::sort(kept.begin(), kept.end(),
            [](const DependencyEdge &a, const DependencyEdge &b) {
              return std::make_pair(a.source, a.target) <
                     std::make_pair(b.source, b.target);
            });

  DependencyGraph reduced(graph.mode());
  for (EventId id = 0; id < n; ++id) {
    ASSIGN_OR_RETURN(EventId copy, reduced.AddEvent(graph.event(id)));
    RET_CHECK(copy == id);
  }
  for (const DependencyEdge &edge : kept) {
    RETURN_IF_ERROR(
        reduced.AddDependency(edge.source, edge.target, *edge.dependency));
  }
  VLOG(1) << "Transitive reduction removed "
          << graph.num_edges() - reduced.num_edges() << " of "
          << graph.num_edges() << " edges.";
  return reduced;
}

}  // namespace p4graphs::tdg
