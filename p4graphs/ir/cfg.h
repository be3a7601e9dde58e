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

// Control flow graph over the tables and conditionals of a P4 program, with
// the reachability and ordering queries the dependency analysis needs.

#ifndef P4GRAPHS_IR_CFG_H_
#define P4GRAPHS_IR_CFG_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/node_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "boost/dynamic_bitset.hpp"
#include "p4graphs/ir/hlir.h"

namespace p4graphs::ir {

// A single node in the control flow graph.
struct CfgNode {
  // Same as the name of the control in the HLIR.
  std::string control_name;
  ControlKind kind;

  // Using btree_set (here and below) for deterministic order.
  absl::btree_set<std::string> children;
  absl::btree_set<std::string> parents;

  // The outcomes leading to each child: action names, hit/miss or "default"
  // for tables, "true"/"false" for conditionals.
  absl::btree_map<std::string, absl::btree_set<std::string>> child_labels;
};

// Returns a string representing the information stored in `cfg_node`.
std::string ToString(const CfgNode &cfg_node);

// Control Flow Graph (CFG) of one control-flow region of a P4 program. The
// region is either the controls reachable from a pipeline's initial control,
// or every control of the program.
// Creation fails with a StructuralError if the region contains a cycle.
class ControlFlowGraph {
 public:
  // Creates the CFG of the controls reachable from the initial control of
  // `pipeline_name`.
  static absl::StatusOr<std::unique_ptr<ControlFlowGraph>> Create(
      const Hlir &hlir, absl::string_view pipeline_name);

  // Creates the CFG of every table and conditional of the program. Controls
  // without predecessors are the roots.
  static absl::StatusOr<std::unique_ptr<ControlFlowGraph>>
  CreateForAllControls(const Hlir &hlir);

  // Returns the node of `control_name`, or a NotFoundError.
  absl::StatusOr<const CfgNode *> GetNode(
      absl::string_view control_name) const;

  // All control names, parents before children. Ties are broken by the order
  // in which construction discovered the controls.
  const std::vector<std::string> &topological_order() const {
    return topological_order_;
  }

  // Returns true if there is a non-empty control-flow path from `from` to
  // `to`. Unknown names are never reachable.
  bool Reaches(absl::string_view from, absl::string_view to) const;

  // Returns a string representing the constructed CFG.
  std::string ToString() const;

  // Disallow copy and move (for pointer stability of returned nodes).
  ControlFlowGraph(const ControlFlowGraph &) = delete;
  ControlFlowGraph(ControlFlowGraph &&) = delete;
  ControlFlowGraph &operator=(const ControlFlowGraph &) = delete;
  ControlFlowGraph &operator=(ControlFlowGraph &&) = delete;

 private:
  // Map of each control name to its corresponding CfgNode.
  // Must use node_hash_map for pointer stability.
  absl::node_hash_map<std::string, CfgNode> node_by_name_;

  // Control names in the order they were first added.
  std::vector<std::string> discovery_order_;

  std::vector<std::string> topological_order_;
  absl::flat_hash_map<std::string, int> topological_index_;

  // Bit i of descendants_[v] is set iff the node at topological index i is
  // reachable from the node at topological index v.
  std::vector<boost::dynamic_bitset<>> descendants_;

  // Can only be constructed through a call to Create.
  ControlFlowGraph() = default;

  // Returns the node of `control_name`, adding it first if needed.
  absl::StatusOr<CfgNode *> GetOrAddNode(const Hlir &hlir,
                                         absl::string_view control_name);

  // Recursively constructs the subgraph rooted at `control_name`.
  absl::Status ConstructSubgraph(const Hlir &hlir,
                                 const std::string &control_name);

  // Orders the nodes topologically and computes the descendant sets. Returns
  // a StructuralError naming one cycle if there is no topological order.
  absl::Status Analyze();

  // Returns one cycle of the graph, assuming one exists.
  std::vector<std::string> FindCycle() const;
};

}  // namespace p4graphs::ir

#endif  // P4GRAPHS_IR_CFG_H_
