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

// Best-effort rendering of DOT files into images.

#ifndef P4GRAPHS_GRAPHVIZ_RENDERER_H_
#define P4GRAPHS_GRAPHVIZ_RENDERER_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace p4graphs::graphviz {

// The format that stops rendering: only the DOT file is kept.
inline constexpr absl::string_view kNoRenderingFormat = "none";

// Converts DOT files to other formats.
class GraphRenderer {
 public:
  virtual ~GraphRenderer() = default;

  // Renders the DOT file at `dot_path` into `output_path` in `format`
  // (e.g. "png", "svg"). Returns an error if the renderer is missing or
  // failed.
  virtual absl::Status Render(const std::string &dot_path,
                              absl::string_view format,
                              const std::string &output_path) = 0;
};

// Renders with the Graphviz `dot` executable.
class GraphvizRenderer : public GraphRenderer {
 public:
  explicit GraphvizRenderer(std::string dot_binary = "dot")
      : dot_binary_(std::move(dot_binary)) {}

  absl::Status Render(const std::string &dot_path, absl::string_view format,
                      const std::string &output_path) override;

 private:
  std::string dot_binary_;
};

// Returns `dot_path` with its ".dot" extension replaced by `format`.
std::string RenderedPath(absl::string_view dot_path, absl::string_view format);

// Tries to render `dot_path` in each of `formats`, in order, and stops at the
// first success. Returns the path of the rendered file, or nullopt if the
// `kNoRenderingFormat` sentinel was reached first. Returns a
// RenderingUnavailable error if every format failed.
absl::StatusOr<std::optional<std::string>> RenderWithFallback(
    GraphRenderer &renderer, const std::string &dot_path,
    absl::Span<const std::string> formats);

}  // namespace p4graphs::graphviz

#endif  // P4GRAPHS_GRAPHVIZ_RENDERER_H_
