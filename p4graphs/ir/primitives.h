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

#ifndef P4GRAPHS_IR_PRIMITIVES_H_
#define P4GRAPHS_IR_PRIMITIVES_H_

#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "p4graphs/ir/primitives.pb.h"

namespace p4graphs::ir {

// Access definitions of the primitive actions known to the analysis, keyed by
// primitive name. Tells the IR which arguments of a primitive call are read
// and which are written.
class PrimitiveTable {
 public:
  // Returns a table holding the built-in P4-14 primitives.
  static absl::StatusOr<PrimitiveTable> CreateWithBuiltIns();

  // Adds `definitions` to the table. A definition replaces any existing
  // definition of the same name. Returns a ConfigurationError for malformed
  // definitions, in which case the table is left unchanged.
  absl::Status Merge(const PrimitiveDefinitions &definitions);

  // Returns the definition of `name`, or nullptr.
  const PrimitiveDefinition *Find(absl::string_view name) const;

  size_t size() const { return definitions_.size(); }

 private:
  absl::flat_hash_map<std::string, PrimitiveDefinition> definitions_;
};

// Returns the built-in table merged with the text-format
// PrimitiveDefinitions documents at `paths`, in order. Unreadable or malformed
// documents are reported as ConfigurationError.
absl::StatusOr<PrimitiveTable> LoadPrimitiveTable(
    absl::Span<const std::string> paths);

}  // namespace p4graphs::ir

#endif  // P4GRAPHS_IR_PRIMITIVES_H_
