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

#include "p4graphs/ir/cfg.h"

#include <algorithm>
#include <functional>
#include <memory>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/substitute.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/util/status.h"

namespace p4graphs::ir {

namespace {

// Returns the children of `control_name` along with the outcomes that lead to
// each of them.
absl::StatusOr<absl::btree_map<std::string, absl::btree_set<std::string>>>
GetLabeledChildren(const Hlir &hlir, const std::string &control_name) {
  absl::btree_map<std::string, absl::btree_set<std::string>> children;
  auto add = [&children](const std::string &child, std::string label) {
    if (!IsEndOfPipeline(child)) children[child].insert(std::move(label));
  };

  if (const Hlir::TableInfo *table = hlir.tables().Find(control_name);
      table != nullptr) {
    for (const auto &[outcome, next_control] : table->table->next_tables()) {
      add(next_control, outcome);
    }
    add(table->table->base_default_next(), "default");
  } else if (const Hlir::ConditionalInfo *conditional =
                 hlir.conditionals().Find(control_name);
             conditional != nullptr) {
    add(conditional->conditional->true_next(), "true");
    add(conditional->conditional->false_next(), "false");
  } else {
    return StructuralErrorBuilder()
           << "Unknown control '" << control_name << "'.";
  }
  return children;
}

}  // namespace

std::string ToString(const CfgNode &node) {
  std::vector<std::string> labeled_children;
  for (const auto &[child, labels] : node.child_labels) {
    labeled_children.push_back(
        absl::StrCat(child, "(", absl::StrJoin(labels, "|"), ")"));
  }
  return absl::Substitute(
      "node: $0 ($1)\n\tchildren: [$2]\n\tparents: [$3]\n", node.control_name,
      node.kind == ControlKind::kTable ? "table" : "conditional",
      absl::StrJoin(labeled_children, ","), absl::StrJoin(node.parents, ","));
}

std::string ControlFlowGraph::ToString() const {
  std::string out;
  absl::StrAppend(&out, node_by_name_.size(), " nodes\n");
  for (const std::string &name : topological_order_) {
    absl::StrAppend(&out, "[", name, "] ",
                    ::p4graphs::ir::ToString(node_by_name_.at(name)));
  }
  return out;
}

absl::StatusOr<const CfgNode *> ControlFlowGraph::GetNode(
    absl::string_view control_name) const {
  auto it = node_by_name_.find(control_name);
  if (it == node_by_name_.end()) {
    return NotFoundErrorBuilder()
           << "Control '" << control_name
           << "' does not correspond to any node in the CFG.";
  }
  return &it->second;
}

absl::StatusOr<CfgNode *> ControlFlowGraph::GetOrAddNode(
    const Hlir &hlir, absl::string_view control_name) {
  auto it = node_by_name_.find(control_name);
  if (it == node_by_name_.end()) {
    ASSIGN_OR_RETURN(ControlKind kind, hlir.GetControlKind(control_name),
                     _.SetCode(absl::StatusCode::kFailedPrecondition));
    CfgNode cfg_node;
    cfg_node.control_name = std::string(control_name);
    cfg_node.kind = kind;
    it = node_by_name_.insert(it,
                              {std::string(control_name), std::move(cfg_node)});
    discovery_order_.push_back(std::string(control_name));
  }
  return &it->second;
}

absl::Status ControlFlowGraph::ConstructSubgraph(
    const Hlir &hlir, const std::string &control_name) {
  ASSIGN_OR_RETURN(CfgNode * cfg_node, GetOrAddNode(hlir, control_name));
  ASSIGN_OR_RETURN(auto children, GetLabeledChildren(hlir, control_name));

  for (auto &[child_name, labels] : children) {
    bool is_new_node = !node_by_name_.contains(child_name);
    ASSIGN_OR_RETURN(CfgNode * child_cfg_node, GetOrAddNode(hlir, child_name));
    cfg_node->children.insert(child_name);
    cfg_node->child_labels[child_name] = std::move(labels);
    child_cfg_node->parents.insert(control_name);

    // If the child is a new node, recursively construct the subgraph.
    if (is_new_node) RETURN_IF_ERROR(ConstructSubgraph(hlir, child_name));
  }
  return absl::OkStatus();
}

std::vector<std::string> ControlFlowGraph::FindCycle() const {
  // Every node left out of the topological order has a parent that was left
  // out too, so walking parents among them must revisit a node.
  std::string current;
  for (const std::string &name : discovery_order_) {
    if (!topological_index_.contains(name)) {
      current = name;
      break;
    }
  }
  if (current.empty()) return {};

  std::vector<std::string> walk;
  absl::flat_hash_map<std::string, int> position;
  while (!position.contains(current)) {
    position[current] = walk.size();
    walk.push_back(current);
    for (const std::string &parent : node_by_name_.at(current).parents) {
      if (!topological_index_.contains(parent)) {
        current = parent;
        break;
      }
    }
  }
  // The walk followed parent links, so the cycle reads backwards.
  std::vector<std::string> cycle(walk.begin() + position[current], walk.end());
  std::reverse(cycle.begin(), cycle.end());
  return cycle;
}

absl::Status ControlFlowGraph::Analyze() {
  absl::flat_hash_map<std::string, int> discovery_index;
  absl::flat_hash_map<std::string, int> in_degree;
  for (int i = 0; i < discovery_order_.size(); ++i) {
    discovery_index[discovery_order_[i]] = i;
    in_degree[discovery_order_[i]] =
        node_by_name_.at(discovery_order_[i]).parents.size();
  }

  // Kahn's algorithm, always picking the earliest discovered ready node.
  std::priority_queue<int, std::vector<int>, std::greater<int>> ready;
  for (int i = 0; i < discovery_order_.size(); ++i) {
    if (in_degree[discovery_order_[i]] == 0) ready.push(i);
  }
  while (!ready.empty()) {
    const std::string &name = discovery_order_[ready.top()];
    ready.pop();
    topological_index_[name] = topological_order_.size();
    topological_order_.push_back(name);
    for (const std::string &child : node_by_name_.at(name).children) {
      if (--in_degree[child] == 0) ready.push(discovery_index[child]);
    }
  }

  if (topological_order_.size() != discovery_order_.size()) {
    return StructuralErrorBuilder()
           << "Control flow contains a cycle: "
           << absl::StrJoin(FindCycle(), " -> ");
  }

  const int n = topological_order_.size();
  descendants_.assign(n, boost::dynamic_bitset<>(n));
  for (int v = n - 1; v >= 0; --v) {
    for (const std::string &child :
         node_by_name_.at(topological_order_[v]).children) {
      const int c = topological_index_.at(child);
      descendants_[v].set(c);
      descendants_[v] |= descendants_[c];
    }
  }
  return absl::OkStatus();
}

bool ControlFlowGraph::Reaches(absl::string_view from,
                               absl::string_view to) const {
  auto from_it = topological_index_.find(from);
  auto to_it = topological_index_.find(to);
  if (from_it == topological_index_.end() ||
      to_it == topological_index_.end()) {
    return false;
  }
  return descendants_[from_it->second].test(to_it->second);
}

absl::StatusOr<std::unique_ptr<ControlFlowGraph>> ControlFlowGraph::Create(
    const Hlir &hlir, absl::string_view pipeline_name) {
  const Pipeline *const *pipeline = hlir.pipelines().Find(pipeline_name);
  if (pipeline == nullptr) {
    return NotFoundErrorBuilder()
           << "Unknown pipeline '" << pipeline_name << "'.";
  }

  // Using `new` to access a non-public constructor.
  auto cfg = absl::WrapUnique(new ControlFlowGraph());
  const std::string &initial_control = (*pipeline)->initial_control();
  if (!IsEndOfPipeline(initial_control)) {
    RETURN_IF_ERROR(cfg->ConstructSubgraph(hlir, initial_control)).SetPrepend()
        << "In pipeline '" << pipeline_name << "': ";
  }
  RETURN_IF_ERROR(cfg->Analyze()).SetPrepend()
      << "In pipeline '" << pipeline_name << "': ";
  return std::move(cfg);
}

absl::StatusOr<std::unique_ptr<ControlFlowGraph>>
ControlFlowGraph::CreateForAllControls(const Hlir &hlir) {
  auto cfg = absl::WrapUnique(new ControlFlowGraph());
  std::vector<std::string> controls;
  for (const auto &[name, _] : hlir.tables()) controls.push_back(name);
  for (const auto &[name, _] : hlir.conditionals()) controls.push_back(name);
  for (const std::string &control : controls) {
    if (!cfg->node_by_name_.contains(control)) {
      RETURN_IF_ERROR(cfg->ConstructSubgraph(hlir, control));
    }
  }
  RETURN_IF_ERROR(cfg->Analyze());
  return std::move(cfg);
}

}  // namespace p4graphs::ir
