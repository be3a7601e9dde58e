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

// Builds the table dependency graph of a control-flow region from the field
// accesses of its tables and conditionals.

#ifndef P4GRAPHS_TDG_BUILDER_H_
#define P4GRAPHS_TDG_BUILDER_H_

#include <string>

#include "absl/status/statusor.h"
#include "p4graphs/ir/cfg.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/dependency_graph.h"

namespace p4graphs::tdg {

struct BuildOptions {
  GraphMode mode = GraphMode::kWholeTable;
  // The region is the controls reachable from this pipeline's initial
  // control. If empty, the region is the whole program.
  std::string pipeline;
};

// Returns the dependency graph of the region described by `options`.
// Returns a StructuralError if the region is malformed or cyclic.
absl::StatusOr<DependencyGraph> BuildDependencyGraph(
    const ir::Hlir &hlir, const BuildOptions &options);

// Returns the dependency graph of the controls of `cfg`.
//
// For every pair of controls (A, B) where B is reachable from A, an edge
// A -> B carries the fields A writes and B's key, condition or actions
// access, as well as the fields A reads and B writes. A pair without such
// fields gets a control-flow-only edge if B directly follows A.
//
// In kSplitMatchAction mode the endpoints are the match and action Events of
// the tables, chosen by which side of each table accesses the fields.
absl::StatusOr<DependencyGraph> BuildDependencyGraph(
    const ir::Hlir &hlir, const ir::ControlFlowGraph &cfg, GraphMode mode);

}  // namespace p4graphs::tdg

#endif  // P4GRAPHS_TDG_BUILDER_H_
