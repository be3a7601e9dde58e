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

// The table dependency graph: Events (tables, table halves or conditionals)
// addressed by dense indices, and ordering constraints between them.

#ifndef P4GRAPHS_TDG_DEPENDENCY_GRAPH_H_
#define P4GRAPHS_TDG_DEPENDENCY_GRAPH_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "boost/dynamic_bitset.hpp"
#include "boost/graph/adjacency_list.hpp"
#include "p4graphs/ir/fields.h"

namespace p4graphs::tdg {

// Granularity of a graph. Selected once per analysis run; the builder and the
// scheduler both dispatch on it.
enum class GraphMode {
  // One Event per table or conditional.
  kWholeTable,
  // A table yields a match Event and an action Event.
  kSplitMatchAction,
};

enum class EventKind { kTable, kMatch, kAction, kConditional };

enum class EdgeKind { kControlFlow, kFieldDependency };

// Why a field-dependency edge exists. Used for labels and colors only.
enum class DependencyType {
  // The source writes a field read by the target's key or condition.
  kMatch,
  // The source writes a field the target's actions read or write.
  kAction,
  // The source reads a field the target writes.
  kReverseRead,
};

std::string GraphModeName(GraphMode mode);
std::string EventKindName(EventKind kind);
std::string EdgeKindName(EdgeKind kind);
std::string DependencyTypeName(DependencyType type);

struct Event {
  // Unique within the graph: "T", "T.match", "T.action" or the conditional.
  std::string name;
  EventKind kind;
  // Name of the table or conditional this Event belongs to.
  std::string control;
};

struct Dependency {
  EdgeKind kind = EdgeKind::kControlFlow;
  absl::btree_set<DependencyType> types;
  ir::FieldSet fields;
  // Set on the T.match -> T.action edge of a split table.
  bool internal = false;
};

using EventId = int;

// A view of one edge of the graph. Valid until the graph is modified.
struct DependencyEdge {
  EventId source;
  EventId target;
  const Dependency *dependency;
};

class DependencyGraph {
 public:
  // We require boost::in_edges, which requires bidirectionalS.
  using Graph = boost::adjacency_list<boost::vecS, boost::vecS,
                                      boost::bidirectionalS, Event, Dependency>;

  explicit DependencyGraph(GraphMode mode) : mode_(mode) {}

  GraphMode mode() const { return mode_; }

  // Adds an Event and returns its index. Indices are dense and assigned in
  // insertion order. Fails if an Event of the same name exists.
  absl::StatusOr<EventId> AddEvent(Event event);

  // Adds an edge from `source` to `target`. An existing edge of the same kind
  // between the two is extended instead: the field sets and dependency types
  // are united. Fails for self edges and unknown Events.
  absl::Status AddDependency(EventId source, EventId target,
                             Dependency dependency);

  int num_events() const { return boost::num_vertices(graph_); }
  int num_edges() const { return boost::num_edges(graph_); }

  const Event &event(EventId id) const { return graph_[id]; }
  std::optional<EventId> FindEvent(absl::string_view name) const;

  // Returns the edge between `source` and `target`, of any kind, or nullptr.
  const Dependency *FindDependency(EventId source, EventId target) const;

  // All edges, ordered by source index and then by insertion.
  std::vector<DependencyEdge> edges() const;
  std::vector<DependencyEdge> out_edges(EventId id) const;
  std::vector<DependencyEdge> in_edges(EventId id) const;

  // Returns the Event indices in a topological order, picking the smallest
  // ready index first. Returns a CycleError if the graph has a cycle.
  absl::StatusOr<std::vector<EventId>> TopologicalOrder() const;

  // Bit j of the i-th set is set iff Event j is reachable from Event i along
  // a non-empty path. Returns a CycleError if the graph has a cycle.
  absl::StatusOr<std::vector<boost::dynamic_bitset<>>> ComputeDescendants()
      const;

  // Checks that the graph is acyclic, has no self edges and no two edges of
  // the same kind between the same Events.
  absl::Status ValidateInvariants() const;

  // A line per Event and a line per edge, in index order.
  std::string ToString() const;

  const Graph &graph() const { return graph_; }

 private:
  GraphMode mode_;
  Graph graph_;
  absl::flat_hash_map<std::string, EventId> event_by_name_;
};

}  // namespace p4graphs::tdg

#endif  // P4GRAPHS_TDG_DEPENDENCY_GRAPH_H_
