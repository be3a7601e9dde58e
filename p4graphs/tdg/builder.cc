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

#include "p4graphs/tdg/builder.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "p4graphs/ir/cfg.h"
#include "p4graphs/ir/fields.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/util/status.h"

namespace p4graphs::tdg {

namespace {

using ::p4graphs::ir::FieldSet;

// The field accesses of one control, split by the side that performs them.
struct ControlAccesses {
  ir::ControlKind kind;
  // Fields read by a table's key or a conditional's expression.
  FieldSet key_reads;
  FieldSet action_reads;
  FieldSet writes;
};

// The Events a control is represented by. In kWholeTable mode, and for
// conditionals, all of them are the same Event.
struct ControlEvents {
  EventId entry;
  EventId exit;
};

absl::StatusOr<ControlAccesses> GetAccesses(const ir::Hlir &hlir,
                                            const std::string &control) {
  ASSIGN_OR_RETURN(ir::ControlKind kind, hlir.GetControlKind(control));
  ControlAccesses accesses{kind};
  if (kind == ir::ControlKind::kTable) {
    const ir::Hlir::TableInfo &table = *hlir.tables().Find(control);
    accesses.key_reads = table.key_reads;
    accesses.action_reads = table.action_accesses.reads;
    accesses.writes = table.action_accesses.writes;
  } else {
    accesses.key_reads = hlir.conditionals().Find(control)->reads;
  }
  return accesses;
}

Dependency FieldDependency(DependencyType type, FieldSet fields) {
  Dependency dependency;
  dependency.kind = EdgeKind::kFieldDependency;
  dependency.types.insert(type);
  dependency.fields = std::move(fields);
  return dependency;
}

class GraphBuilder {
 public:
  GraphBuilder(const ir::Hlir &hlir, const ir::ControlFlowGraph &cfg,
               GraphMode mode)
      : hlir_(hlir), cfg_(cfg), graph_(mode) {}

  absl::StatusOr<DependencyGraph> Build() && {
    RETURN_IF_ERROR(AddEvents());
    const std::vector<std::string> &controls = cfg_.topological_order();
    // Field dependencies first, so that a control-flow edge is only added
    // where no field dependency already joins the exit of a control to the
    // entry of its child. In kSplitMatchAction mode only a MATCH dependency
    // does; the others end at the child's action Event.
    for (int a = 0; a < controls.size(); ++a) {
      for (int b = a + 1; b < controls.size(); ++b) {
        if (!cfg_.Reaches(controls[a], controls[b])) continue;
        RETURN_IF_ERROR(AddFieldDependencies(controls[a], controls[b]));
      }
    }
    for (const std::string &control : controls) {
      ASSIGN_OR_RETURN(const ir::CfgNode *node, cfg_.GetNode(control));
      for (const std::string &child : node->children) {
        const EventId source = events_.at(control).exit;
        const EventId target = events_.at(child).entry;
        if (graph_.FindDependency(source, target) != nullptr) continue;
        Dependency dependency;
        dependency.kind = EdgeKind::kControlFlow;
        RETURN_IF_ERROR(
            graph_.AddDependency(source, target, std::move(dependency)));
      }
    }
    LOG(INFO) << "Built " << GraphModeName(graph_.mode())
              << " dependency graph with " << graph_.num_events()
              << " events and " << graph_.num_edges() << " edges.";
    return std::move(graph_);
  }

 private:
  // Adds the Events of every control, in control-flow order, so that Event
  // indices are a topological order.
  absl::Status AddEvents() {
    const bool split = graph_.mode() == GraphMode::kSplitMatchAction;
    for (const std::string &control : cfg_.topological_order()) {
      ASSIGN_OR_RETURN(ControlAccesses accesses, GetAccesses(hlir_, control));
      accesses_[control] = accesses;
      if (accesses.kind == ir::ControlKind::kConditional) {
        ASSIGN_OR_RETURN(EventId id,
                         AddEvent(control, EventKind::kConditional, control));
        events_[control] = {id, id};
      } else if (!split) {
        ASSIGN_OR_RETURN(EventId id,
                         AddEvent(control, EventKind::kTable, control));
        events_[control] = {id, id};
      } else {
        ASSIGN_OR_RETURN(EventId match,
                         AddEvent(absl::StrCat(control, ".match"),
                                  EventKind::kMatch, control));
        ASSIGN_OR_RETURN(EventId action,
                         AddEvent(absl::StrCat(control, ".action"),
                                  EventKind::kAction, control));
        Dependency internal;
        internal.kind = EdgeKind::kControlFlow;
        internal.internal = true;
        RETURN_IF_ERROR(graph_.AddDependency(match, action, internal));
        events_[control] = {match, action};
      }
    }
    return absl::OkStatus();
  }

  absl::StatusOr<EventId> AddEvent(std::string name, EventKind kind,
                                   const std::string &control) {
    Event event;
    event.name = std::move(name);
    event.kind = kind;
    event.control = control;
    return graph_.AddEvent(std::move(event));
  }

  // Adds the field-dependency edges from control `a` to control `b`, where
  // `b` is reachable from `a`.
  absl::Status AddFieldDependencies(const std::string &a,
                                    const std::string &b) {
    const ControlAccesses &source = accesses_.at(a);
    const ControlAccesses &target = accesses_.at(b);
    const ControlEvents &source_events = events_.at(a);
    const ControlEvents &target_events = events_.at(b);

    const FieldSet target_reads =
        ir::Union(target.key_reads, target.action_reads);
    if (!ir::MayOverlap(source.writes,
                        ir::Union(target_reads, target.writes)) &&
        !ir::MayOverlap(ir::Union(source.key_reads, source.action_reads),
                        target.writes)) {
      return absl::OkStatus();
    }

    FieldSet match = ir::Intersection(source.writes, target.key_reads);
    FieldSet action = ir::Intersection(
        source.writes, ir::Union(target.action_reads, target.writes));
    FieldSet key_reverse_read =
        ir::Intersection(source.key_reads, target.writes);
    FieldSet action_reverse_read =
        ir::Intersection(source.action_reads, target.writes);
    if (match.empty() && action.empty() && key_reverse_read.empty() &&
        action_reverse_read.empty()) {
      return absl::OkStatus();
    }

    // The exit of a table is its action Event and its entry the match Event;
    // a conditional is both. In kWholeTable mode all of these coincide and
    // the calls below merge into a single edge.
    if (!match.empty()) {
      RETURN_IF_ERROR(graph_.AddDependency(
          source_events.exit, target_events.entry,
          FieldDependency(DependencyType::kMatch, std::move(match))));
    }
    if (!action.empty()) {
      RETURN_IF_ERROR(graph_.AddDependency(
          source_events.exit, target_events.exit,
          FieldDependency(DependencyType::kAction, std::move(action))));
    }
    if (!key_reverse_read.empty()) {
      RETURN_IF_ERROR(graph_.AddDependency(
          source_events.entry, target_events.exit,
          FieldDependency(DependencyType::kReverseRead,
                          std::move(key_reverse_read))));
    }
    if (!action_reverse_read.empty()) {
      RETURN_IF_ERROR(graph_.AddDependency(
          source_events.exit, target_events.exit,
          FieldDependency(DependencyType::kReverseRead,
                          std::move(action_reverse_read))));
    }
    return absl::OkStatus();
  }

  const ir::Hlir &hlir_;
  const ir::ControlFlowGraph &cfg_;
  DependencyGraph graph_;
  absl::flat_hash_map<std::string, ControlAccesses> accesses_;
  absl::flat_hash_map<std::string, ControlEvents> events_;
};

}  // namespace

absl::StatusOr<DependencyGraph> BuildDependencyGraph(
    const ir::Hlir &hlir, const ir::ControlFlowGraph &cfg, GraphMode mode) {
  return GraphBuilder(hlir, cfg, mode).Build();
}

absl::StatusOr<DependencyGraph> BuildDependencyGraph(
    const ir::Hlir &hlir, const BuildOptions &options) {
  std::unique_ptr<ir::ControlFlowGraph> cfg;
  if (options.pipeline.empty()) {
    ASSIGN_OR_RETURN(cfg, ir::ControlFlowGraph::CreateForAllControls(hlir));
  } else {
    ASSIGN_OR_RETURN(cfg, ir::ControlFlowGraph::Create(hlir, options.pipeline));
  }
  VLOG(1) << cfg->ToString();
  return BuildDependencyGraph(hlir, *cfg, options.mode);
}

}  // namespace p4graphs::tdg
