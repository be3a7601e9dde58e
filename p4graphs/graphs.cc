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

#include "p4graphs/graphs.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "p4graphs/graphviz/dot.h"
#include "p4graphs/graphviz/renderer.h"
#include "p4graphs/ir/cfg.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/tdg/analysis.h"
#include "p4graphs/tdg/scheduler.h"
#include "p4graphs/util/io.h"
#include "p4graphs/util/status.h"

namespace p4graphs {

namespace {

class GraphWriter {
 public:
  GraphWriter(const GenerationOptions &options,
              graphviz::GraphRenderer &renderer, GenerationResult &result)
      : options_(options), renderer_(renderer), result_(result) {}

  // Writes `dot` to `file_name` in the output directory and renders it. A
  // rendering failure is recorded and does not fail the call.
  absl::Status Write(const std::string &dot, absl::string_view file_name) {
    const std::string path = JoinPath(options_.gen_dir, file_name);
    RETURN_IF_ERROR(WriteFile(dot, path));
    result_.files.push_back(path);

    absl::StatusOr<std::optional<std::string>> rendered =
        graphviz::RenderWithFallback(renderer_, path, options_.formats);
    if (!rendered.ok()) {
      LOG(WARNING) << rendered.status();
      if (result_.rendering_status.ok()) {
        result_.rendering_status = rendered.status();
      }
    } else if (rendered->has_value()) {
      result_.files.push_back(**rendered);
    }
    return absl::OkStatus();
  }

 private:
  const GenerationOptions &options_;
  graphviz::GraphRenderer &renderer_;
  GenerationResult &result_;
};

// Generates the table graphs of one control-flow region. An empty
// `pipeline` selects the whole program.
absl::Status GenerateRegionGraphs(const ir::Hlir &hlir,
                                  const std::string &pipeline,
                                  const absl::btree_set<GraphKind> &kinds,
                                  const GenerationOptions &options,
                                  GraphWriter &writer,
                                  GenerationResult &result) {
  const std::string region =
      pipeline.empty() ? std::string(kWholeProgramRegion) : pipeline;

  if (kinds.contains(GraphKind::kTables)) {
    std::unique_ptr<ir::ControlFlowGraph> cfg;
    if (pipeline.empty()) {
      ASSIGN_OR_RETURN(cfg, ir::ControlFlowGraph::CreateForAllControls(hlir));
    } else {
      ASSIGN_OR_RETURN(cfg, ir::ControlFlowGraph::Create(hlir, pipeline));
    }
    ASSIGN_OR_RETURN(
        std::string dot,
        graphviz::ControlFlowGraphToDot(hlir, *cfg, region, options.dot));
    RETURN_IF_ERROR(writer.Write(dot, absl::StrCat(region, ".tables.dot")));
  }

  if (kinds.contains(GraphKind::kDependencies)) {
    tdg::AnalysisOptions analysis = options.analysis;
    analysis.build.pipeline = pipeline;
    ASSIGN_OR_RETURN(tdg::AnalysisResult analyzed,
                     tdg::AnalyzeTableDependencies(hlir, analysis),
                     _.SetPrepend() << "In region '" << region << "': ");
    if (options.validate_modes) {
      RETURN_IF_ERROR(tdg::CheckModeConsistency(hlir, analysis.build,
                                                analysis.scheduler))
              .SetPrepend()
          << "In region '" << region << "': ";
    }
    ASSIGN_OR_RETURN(std::string dot,
                     graphviz::DependencyGraphToDot(hlir, analyzed.graph,
                                                    analyzed.schedule, region,
                                                    options.dot));
    RETURN_IF_ERROR(
        writer.Write(dot, absl::StrCat(region, ".tables_dep.dot")));
    result.regions.push_back({region, analyzed.graph.mode(),
                              tdg::NumStages(analyzed.schedule)});
  }
  return absl::OkStatus();
}

// Checks that every pipeline and parser name can be used as the stem of a file
// in the output directory.
absl::Status CheckRegionNames(const ir::Hlir &hlir) {
  for (const auto &[name, _] : hlir.pipelines()) {
    if (!IsPlainFileName(name)) {
      return StructuralErrorBuilder()
             << "Pipeline name '" << name << "' cannot be used as a file name.";
    }
  }
  for (const auto &[name, _] : hlir.parsers()) {
    if (!IsPlainFileName(name)) {
      return StructuralErrorBuilder()
             << "Parser name '" << name << "' cannot be used as a file name.";
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<GraphKind> ParseGraphKind(absl::string_view name) {
  if (name == "parser") return GraphKind::kParser;
  if (name == "tables") return GraphKind::kTables;
  if (name == "deps") return GraphKind::kDependencies;
  return ConfigurationErrorBuilder()
         << "Unknown graph kind '" << name
         << "'. Expected 'parser', 'tables' or 'deps'.";
}

absl::Status ValidateGenerationOptions(const GenerationOptions &options) {
  RETURN_IF_ERROR(ValidateOutputDirectory(options.gen_dir));
  if (options.graphs.empty()) {
    return ConfigurationErrorBuilder() << "No graph kinds were requested.";
  }
  for (const std::string &graph : options.graphs) {
    RETURN_IF_ERROR(ParseGraphKind(graph).status());
  }
  if (options.formats.empty()) {
    return ConfigurationErrorBuilder()
           << "No output formats were given. Use '"
           << graphviz::kNoRenderingFormat << "' to emit DOT files only.";
  }
  for (const std::string &format : options.formats) {
    bool valid = !format.empty();
    for (char c : format) valid = valid && absl::ascii_isalnum(c);
    if (!valid) {
      return ConfigurationErrorBuilder()
             << "Invalid output format '" << format << "'.";
    }
  }
  RETURN_IF_ERROR(
      graphviz::ValidateDotOptions(options.dot, options.analysis.build.mode));
  return absl::OkStatus();
}

absl::StatusOr<GenerationResult> GenerateGraphs(
    const ir::Hlir &hlir, const GenerationOptions &options,
    graphviz::GraphRenderer &renderer) {
  RETURN_IF_ERROR(ValidateGenerationOptions(options));
  RETURN_IF_ERROR(CheckRegionNames(hlir));
  absl::btree_set<GraphKind> kinds;
  for (const std::string &graph : options.graphs) {
    ASSIGN_OR_RETURN(GraphKind kind, ParseGraphKind(graph));
    kinds.insert(kind);
  }

  GenerationResult result;
  GraphWriter writer(options, renderer, result);

  if (kinds.contains(GraphKind::kParser)) {
    for (const auto &[name, _] : hlir.parsers()) {
      ASSIGN_OR_RETURN(std::string dot, graphviz::ParserToDot(hlir, name));
      RETURN_IF_ERROR(writer.Write(dot, absl::StrCat(name, ".parser.dot")));
    }
  }

  if (hlir.pipelines().empty()) {
    RETURN_IF_ERROR(GenerateRegionGraphs(hlir, /*pipeline=*/"", kinds, options,
                                         writer, result));
  }
  for (const auto &[name, _] : hlir.pipelines()) {
    RETURN_IF_ERROR(
        GenerateRegionGraphs(hlir, name, kinds, options, writer, result));
  }
  return result;
}

}  // namespace p4graphs
