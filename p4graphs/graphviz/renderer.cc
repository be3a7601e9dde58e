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

#include "p4graphs/graphviz/renderer.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"
#include "p4graphs/util/status.h"
#include "p4graphs/util/subprocess.h"

namespace p4graphs::graphviz {

absl::Status GraphvizRenderer::Render(const std::string &dot_path,
                                      absl::string_view format,
                                      const std::string &output_path) {
  const std::string command =
      absl::StrCat(ShellQuote(dot_binary_), " ",
                   ShellQuote(absl::StrCat("-T", format)), " ",
                   ShellQuote(dot_path), " -o ", ShellQuote(output_path),
                   " 2>&1");
  ASSIGN_OR_RETURN(CommandResult result, RunCommand(command));
  // The shell reports a missing executable with exit code 127.
  if (result.exit_code == 127) {
    return UnavailableErrorBuilder()
           << "Graphviz executable '" << dot_binary_ << "' not found.";
  }
  if (result.exit_code != 0) {
    return UnavailableErrorBuilder()
           << "'" << command << "' exited with code " << result.exit_code
           << ": " << result.output;
  }
  return absl::OkStatus();
}

std::string RenderedPath(absl::string_view dot_path,
                         absl::string_view format) {
  absl::ConsumeSuffix(&dot_path, ".dot");
  return absl::StrCat(dot_path, ".", format);
}

absl::StatusOr<std::optional<std::string>> RenderWithFallback(
    GraphRenderer &renderer, const std::string &dot_path,
    absl::Span<const std::string> formats) {
  std::vector<std::string> failures;
  for (const std::string &format : formats) {
    if (format == kNoRenderingFormat) {
      if (!failures.empty()) {
        LOG(WARNING) << "Keeping only " << dot_path << ": "
                     << absl::StrJoin(failures, "; ");
      }
      return std::nullopt;
    }
    const std::string output_path = RenderedPath(dot_path, format);
    absl::Status status = renderer.Render(dot_path, format, output_path);
    if (status.ok()) {
      LOG(INFO) << "Rendered " << output_path;
      return std::optional<std::string>(output_path);
    }
    failures.push_back(absl::StrCat(format, ": ", status.message()));
  }
  return RenderingUnavailableErrorBuilder()
         << "Could not render " << dot_path << " in any of ["
         << absl::StrJoin(formats, ", ")
         << "]: " << absl::StrJoin(failures, "; ");
}

}  // namespace p4graphs::graphviz
