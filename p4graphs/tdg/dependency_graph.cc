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

#include "p4graphs/tdg/dependency_graph.h"

#include <functional>
#include <optional>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "boost/dynamic_bitset.hpp"
#include "boost/graph/adjacency_list.hpp"
#include "p4graphs/ir/fields.h"
#include "p4graphs/util/status.h"

namespace p4graphs::tdg {

std::string GraphModeName(GraphMode mode) {
  switch (mode) {
    case GraphMode::kWholeTable:
      return "whole-table";
    case GraphMode::kSplitMatchAction:
      return "split-match-action";
  }
  return "unknown";
}

std::string EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kTable:
      return "table";
    case EventKind::kMatch:
      return "match";
    case EventKind::kAction:
      return "action";
    case EventKind::kConditional:
      return "conditional";
  }
  return "unknown";
}

std::string EdgeKindName(EdgeKind kind) {
  switch (kind) {
    case EdgeKind::kControlFlow:
      return "control-flow";
    case EdgeKind::kFieldDependency:
      return "field-dependency";
  }
  return "unknown";
}

std::string DependencyTypeName(DependencyType type) {
  switch (type) {
    case DependencyType::kMatch:
      return "MATCH";
    case DependencyType::kAction:
      return "ACTION";
    case DependencyType::kReverseRead:
      return "REVERSE_READ";
  }
  return "UNKNOWN";
}

absl::StatusOr<EventId> DependencyGraph::AddEvent(Event event) {
  if (event_by_name_.contains(event.name)) {
    return InternalErrorBuilder()
           << "Duplicate event '" << event.name << "' in dependency graph.";
  }
  std::string name = event.name;
  EventId id = boost::add_vertex(std::move(event), graph_);
  event_by_name_[std::move(name)] = id;
  return id;
}

absl::Status DependencyGraph::AddDependency(EventId source, EventId target,
                                            Dependency dependency) {
  RET_CHECK(source >= 0 && source < num_events() && target >= 0 &&
            target < num_events())
      << ": edge " << source << " -> " << target << " has unknown endpoints.";
  RET_CHECK(source != target)
      << ": self edge on event '" << event(source).name << "'.";

  for (auto [it, end] = boost::out_edges(source, graph_); it != end; ++it) {
    if (boost::target(*it, graph_) != target) continue;
    Dependency &existing = graph_[*it];
    if (existing.kind != dependency.kind) continue;
    existing.types.insert(dependency.types.begin(), dependency.types.end());
    existing.fields.insert(dependency.fields.begin(), dependency.fields.end());
    existing.internal = existing.internal && dependency.internal;
    return absl::OkStatus();
  }
  boost::add_edge(source, target, std::move(dependency), graph_);
  return absl::OkStatus();
}

std::optional<EventId> DependencyGraph::FindEvent(
    absl::string_view name) const {
  auto it = event_by_name_.find(name);
  if (it == event_by_name_.end()) return std::nullopt;
  return it->second;
}

const Dependency *DependencyGraph::FindDependency(EventId source,
                                                  EventId target) const {
  for (auto [it, end] = boost::out_edges(source, graph_); it != end; ++it) {
    if (boost::target(*it, graph_) == target) return &graph_[*it];
  }
  return nullptr;
}

std::vector<DependencyEdge> DependencyGraph::out_edges(EventId id) const {
  std::vector<DependencyEdge> edges;
  for (auto [it, end] = boost::out_edges(id, graph_); it != end; ++it) {
    edges.push_back({id, static_cast<EventId>(boost::target(*it, graph_)),
                     &graph_[*it]});
  }
  return edges;
}

std::vector<DependencyEdge> DependencyGraph::in_edges(EventId id) const {
  std::vector<DependencyEdge> edges;
  for (auto [it, end] = boost::in_edges(id, graph_); it != end; ++it) {
    edges.push_back({static_cast<EventId>(boost::source(*it, graph_)), id,
                     &graph_[*it]});
  }
  return edges;
}

std::vector<DependencyEdge> DependencyGraph::edges() const {
  std::vector<DependencyEdge> edges;
  for (EventId id = 0; id < num_events(); ++id) {
    std::vector<DependencyEdge> out = out_edges(id);
    edges.insert(edges.end(), out.begin(), out.end());
  }
  return edges;
}

absl::StatusOr<std::vector<EventId>> DependencyGraph::TopologicalOrder()
    const {
  std::vector<int> in_degree(num_events());
  std::priority_queue<EventId, std::vector<EventId>, std::greater<EventId>>
      ready;
  for (EventId id = 0; id < num_events(); ++id) {
    in_degree[id] = boost::in_degree(id, graph_);
    if (in_degree[id] == 0) ready.push(id);
  }

  std::vector<EventId> order;
  order.reserve(num_events());
  while (!ready.empty()) {
    EventId id = ready.top();
    ready.pop();
    order.push_back(id);
    for (auto [it, end] = boost::out_edges(id, graph_); it != end; ++it) {
      EventId child = boost::target(*it, graph_);
      if (--in_degree[child] == 0) ready.push(child);
    }
  }

  if (order.size() != num_events()) {
    std::vector<std::string> remaining;
    for (EventId id = 0; id < num_events(); ++id) {
      if (in_degree[id] > 0) remaining.push_back(event(id).name);
    }
    return CycleErrorBuilder()
           << "Dependency graph has no topological order. Events on or "
              "behind a cycle: "
           << absl::StrJoin(remaining, ", ");
  }
  return order;
}

absl::StatusOr<std::vector<boost::dynamic_bitset<>>>
DependencyGraph::ComputeDescendants() const {
  ASSIGN_OR_RETURN(std::vector<EventId> order, TopologicalOrder());
  std::vector<boost::dynamic_bitset<>> descendants(
      num_events(), boost::dynamic_bitset<>(num_events()));
  for (auto v = order.rbegin(); v != order.rend(); ++v) {
    for (auto [it, end] = boost::out_edges(*v, graph_); it != end; ++it) {
      EventId child = boost::target(*it, graph_);
      descendants[*v].set(child);
      descendants[*v] |= descendants[child];
    }
  }
  return descendants;
}

absl::Status DependencyGraph::ValidateInvariants() const {
  for (EventId id = 0; id < num_events(); ++id) {
    absl::flat_hash_set<std::pair<EventId, EdgeKind>> seen;
    for (const DependencyEdge &edge : out_edges(id)) {
      RET_CHECK(edge.source != edge.target)
          << ": self edge on event '" << event(id).name << "'.";
      RET_CHECK(seen.insert({edge.target, edge.dependency->kind}).second)
          << ": duplicate " << EdgeKindName(edge.dependency->kind)
          << " edge " << event(id).name << " -> "
          << event(edge.target).name << ".";
    }
  }
  return TopologicalOrder().status();
}

std::string DependencyGraph::ToString() const {
  std::string out = absl::StrCat(GraphModeName(mode_), " graph: ",
                                 num_events(), " events, ", num_edges(),
                                 " edges\n");
  for (EventId id = 0; id < num_events(); ++id) {
    absl::StrAppend(&out, "  [", id, "] ", event(id).name, " (",
                    EventKindName(event(id).kind), ")\n");
  }
  for (const DependencyEdge &edge : edges()) {
    const Dependency &dependency = *edge.dependency;
    absl::StrAppend(&out, "  ", event(edge.source).name, " -> ",
                    event(edge.target).name, " ",
                    EdgeKindName(dependency.kind));
    if (!dependency.types.empty()) {
      absl::StrAppend(
          &out, " [",
          absl::StrJoin(dependency.types, ",",
                        [](std::string *out, DependencyType type) {
                          absl::StrAppend(out, DependencyTypeName(type));
                        }),
          "]");
    }
    if (!dependency.fields.empty()) {
      absl::StrAppend(&out, " ", ir::ToString(dependency.fields));
    }
    if (dependency.internal) absl::StrAppend(&out, " internal");
    absl::StrAppend(&out, "\n");
  }
  return out;
}

}  // namespace p4graphs::tdg
