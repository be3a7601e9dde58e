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

// Generates the graph files of a P4 program: the parse graph of every parser,
// and the table control flow and table dependency graphs of every pipeline.

#ifndef P4GRAPHS_GRAPHS_H_
#define P4GRAPHS_GRAPHS_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "p4graphs/graphviz/dot.h"
#include "p4graphs/graphviz/renderer.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/analysis.h"
#include "p4graphs/tdg/dependency_graph.h"

namespace p4graphs {

enum class GraphKind { kParser, kTables, kDependencies };

// Parses "parser", "tables" or "deps". Returns a ConfigurationError for
// anything else.
absl::StatusOr<GraphKind> ParseGraphKind(absl::string_view name);

// Name of the region used for programs without pipelines.
inline constexpr absl::string_view kWholeProgramRegion = "program";

struct GenerationOptions {
  // Existing directory receiving all files.
  std::string gen_dir;
  std::vector<std::string> graphs = {"parser", "tables", "deps"};
  // Rendering preference order. `graphviz::kNoRenderingFormat` stops
  // rendering.
  std::vector<std::string> formats = {
      "png", std::string(graphviz::kNoRenderingFormat)};
  // `analysis.build.pipeline` is set per pipeline.
  tdg::AnalysisOptions analysis;
  graphviz::DotOptions dot;
  // Check that both graph modes agree on every pipeline.
  bool validate_modes = false;
};

// Returns a ConfigurationError if the options are inconsistent or
// `gen_dir` is not a writable directory.
absl::Status ValidateGenerationOptions(const GenerationOptions &options);

struct RegionSummary {
  // The pipeline name, or `kWholeProgramRegion`.
  std::string region;
  tdg::GraphMode mode;
  // The stage count, or the critical-path length for split graphs.
  int num_stages = 0;
};

struct GenerationResult {
  // DOT files and rendered images, in the order they were written.
  std::vector<std::string> files;
  std::vector<RegionSummary> regions;
  // The first rendering failure, if any. Rendering failures do not stop
  // generation.
  absl::Status rendering_status;
};

// Writes the requested graphs of `hlir` to `options.gen_dir`:
// <pipeline>.tables_dep.dot, <pipeline>.tables.dot and <parser>.parser.dot,
// each rendered with `renderer` as far as `options.formats` asks for.
// Analysis and I/O errors are returned, as is a StructuralError for a
// pipeline or parser name that is not a plain file name. Rendering errors are
// recorded in the result.
absl::StatusOr<GenerationResult> GenerateGraphs(
    const ir::Hlir &hlir, const GenerationOptions &options,
    graphviz::GraphRenderer &renderer);

}  // namespace p4graphs

#endif  // P4GRAPHS_GRAPHS_H_
