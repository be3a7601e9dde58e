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

// Main file for generating the graphs of a P4 program.
// Expects the HLIR of the program, either as a text-format P4Program or
// through an external frontend, and an output directory as command line
// flags. Prints the number of stages of every pipeline.

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "google/protobuf/message_lite.h"
#include "p4graphs/graphs.h"
#include "p4graphs/graphviz/renderer.h"
#include "p4graphs/ir/frontend.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/ir/ir.pb.h"
#include "p4graphs/ir/primitives.h"
#include "p4graphs/tdg/dependency_graph.h"
#include "p4graphs/util/status.h"

ABSL_FLAG(std::string, hlir, "",
          "The path to the text-format P4Program (HLIR) of the program");
ABSL_FLAG(std::string, p4, "",
          "The path to a P4 source file, translated with --frontend instead "
          "of reading --hlir");
ABSL_FLAG(std::string, frontend, "",
          "Command printing the text-format P4Program of the P4 source file "
          "given as its last argument");
ABSL_FLAG(std::string, preprocessor_flags, "",
          "Flags passed to the frontend untouched, e.g. \"-DFOO -Iinclude\"");
ABSL_FLAG(std::vector<std::string>, primitives, {},
          "Text-format PrimitiveDefinitions files merged into the built-in "
          "primitives");
ABSL_FLAG(std::string, gen_dir, ".",
          "The existing directory receiving the generated files");
ABSL_FLAG(std::vector<std::string>, graphs,
          std::vector<std::string>({"parser", "tables", "deps"}),
          "The graphs to generate: parser, tables, deps");
ABSL_FLAG(std::vector<std::string>, formats,
          std::vector<std::string>({"png", "none"}),
          "Rendering formats in order of preference; 'none' keeps only the "
          "DOT files");
ABSL_FLAG(bool, split_match_action, false,
          "Split every table into a match and an action event and report "
          "the critical path");
ABSL_FLAG(bool, no_transitive_reduction, false,
          "Keep the edges implied by other edges in whole-table graphs");
ABSL_FLAG(bool, critical_path_only, false,
          "Draw only the critical edges (requires --split_match_action)");
ABSL_FLAG(bool, count_conditionals, false,
          "Conditionals occupy a stage like tables");
ABSL_FLAG(bool, show_control_flow_edges, true,
          "Draw control-flow-only edges");
ABSL_FLAG(bool, show_condition_text, false,
          "Show the condition of conditionals in their labels");
ABSL_FLAG(bool, show_fields, false,
          "Show the fields of every dependency on its edge");
ABSL_FLAG(bool, debug_stages, false, "Log and label the computed stages");
ABSL_FLAG(bool, debug_key_result_widths, false,
          "Label tables with their key and action data widths");
ABSL_FLAG(bool, validate_modes, false,
          "Check that whole-table and split graphs agree on reachability "
          "and stage count");

namespace {

p4graphs::GenerationOptions GenerationOptionsFromFlags() {
  p4graphs::GenerationOptions options;
  options.gen_dir = absl::GetFlag(FLAGS_gen_dir);
  options.graphs = absl::GetFlag(FLAGS_graphs);
  options.formats = absl::GetFlag(FLAGS_formats);
  options.analysis.build.mode =
      absl::GetFlag(FLAGS_split_match_action)
          ? p4graphs::tdg::GraphMode::kSplitMatchAction
          : p4graphs::tdg::GraphMode::kWholeTable;
  options.analysis.transitive_reduction =
      !absl::GetFlag(FLAGS_no_transitive_reduction);
  options.analysis.scheduler.count_conditionals =
      absl::GetFlag(FLAGS_count_conditionals);
  options.analysis.scheduler.debug_stages = absl::GetFlag(FLAGS_debug_stages);
  options.dot.show_control_flow_edges =
      absl::GetFlag(FLAGS_show_control_flow_edges);
  options.dot.show_condition_text = absl::GetFlag(FLAGS_show_condition_text);
  options.dot.show_fields = absl::GetFlag(FLAGS_show_fields);
  options.dot.critical_path_only = absl::GetFlag(FLAGS_critical_path_only);
  options.dot.debug_stages = absl::GetFlag(FLAGS_debug_stages);
  options.dot.debug_key_result_widths =
      absl::GetFlag(FLAGS_debug_key_result_widths);
  options.validate_modes = absl::GetFlag(FLAGS_validate_modes);
  return options;
}

absl::StatusOr<p4graphs::ir::P4Program> LoadProgram() {
  const std::string hlir_path = absl::GetFlag(FLAGS_hlir);
  const std::string p4_path = absl::GetFlag(FLAGS_p4);
  if (hlir_path.empty() == p4_path.empty()) {
    return p4graphs::ConfigurationErrorBuilder()
           << "Exactly one of --hlir and --p4 is required.";
  }
  if (!hlir_path.empty()) return p4graphs::ir::ReadHlirFile(hlir_path);
  p4graphs::ir::FrontendOptions frontend;
  frontend.command = absl::GetFlag(FLAGS_frontend);
  frontend.preprocessor_flags = absl::GetFlag(FLAGS_preprocessor_flags);
  return p4graphs::ir::RunFrontend(p4_path, frontend);
}

absl::Status Main() {
  // Configuration errors are reported before any analysis work begins.
  const p4graphs::GenerationOptions options = GenerationOptionsFromFlags();
  RETURN_IF_ERROR(p4graphs::ValidateGenerationOptions(options));
  ASSIGN_OR_RETURN(
      p4graphs::ir::PrimitiveTable primitives,
      p4graphs::ir::LoadPrimitiveTable(absl::GetFlag(FLAGS_primitives)));

  ASSIGN_OR_RETURN(p4graphs::ir::P4Program program, LoadProgram());
  ASSIGN_OR_RETURN(std::unique_ptr<p4graphs::ir::Hlir> hlir,
                   p4graphs::ir::LoadHlir(std::move(program), primitives));

  p4graphs::graphviz::GraphvizRenderer renderer;
  ASSIGN_OR_RETURN(p4graphs::GenerationResult result,
                   p4graphs::GenerateGraphs(*hlir, options, renderer));
  for (const p4graphs::RegionSummary &region : result.regions) {
    if (region.mode == p4graphs::tdg::GraphMode::kWholeTable) {
      std::cout << region.region << ": " << region.num_stages << " stages"
                << std::endl;
    } else {
      std::cout << region.region << ": critical path of " << region.num_stages
                << " stages" << std::endl;
    }
  }
  return result.rendering_status;
}

}  // namespace

int main(int argc, char *argv[]) {
  // Command line arguments and help message.
  absl::SetProgramUsageMessage(absl::StrFormat(
      "usage: %s %s", argv[0],
      "(--hlir=path/to/program.hlir.txt | --p4=path/to/program.p4 "
      "--frontend=command [--preprocessor_flags=...]) --gen_dir=path/to/dir "
      "[--graphs=parser,tables,deps] [--formats=png,none] "
      "[--split_match_action]"));
  absl::ParseCommandLine(argc, argv);

  // Run code
  absl::Status status = Main();

  // Clean up
  google::protobuf::ShutdownProtobufLibrary();

  // Error handling.
  if (!status.ok()) {
    std::cerr << "Error: " << status << std::endl;
    return 1;
  }
  return 0;
}
