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

#include "p4graphs/ir/frontend.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/util/proto.h"
#include "p4graphs/util/status.h"
#include "p4graphs/util/subprocess.h"

namespace p4graphs::ir {

absl::StatusOr<P4Program> ReadHlirFile(const std::string &hlir_path) {
  P4Program program;
  RETURN_IF_ERROR(ReadProtoFromFile(hlir_path, &program))
          .SetCode(absl::StatusCode::kFailedPrecondition)
          .SetPrepend()
      << "While trying to parse HLIR file '" << hlir_path << "': ";
  return program;
}

absl::StatusOr<P4Program> RunFrontend(const std::string &p4_path,
                                      const FrontendOptions &options) {
  if (options.command.empty()) {
    return ConfigurationErrorBuilder()
           << "A frontend command is required to load '" << p4_path << "'.";
  }
  const std::string command =
      absl::StrCat(options.command, " ", options.preprocessor_flags, " ",
                   ShellQuote(p4_path));
  LOG(INFO) << "Running frontend: " << command;
  ASSIGN_OR_RETURN(CommandResult result, RunCommand(command));
  if (result.exit_code != 0) {
    return StructuralErrorBuilder()
           << "Frontend exited with code " << result.exit_code << " on '"
           << p4_path << "'.";
  }

  P4Program program;
  RETURN_IF_ERROR(ReadProtoFromString(result.output, &program))
          .SetCode(absl::StatusCode::kFailedPrecondition)
          .SetPrepend()
      << "While trying to parse the frontend output for '" << p4_path
      << "': ";
  return program;
}

absl::StatusOr<std::unique_ptr<Hlir>> LoadHlir(
    P4Program program, const PrimitiveTable &primitives) {
  ASSIGN_OR_RETURN(std::unique_ptr<Hlir> hlir,
                   Hlir::Create(std::move(program), primitives));
  LOG(INFO) << "Loaded HLIR with " << hlir->tables().size() << " tables, "
            << hlir->conditionals().size() << " conditionals and "
            << hlir->pipelines().size() << " pipelines.";
  return hlir;
}

}  // namespace p4graphs::ir
