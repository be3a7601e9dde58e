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

// Validated, immutable view of a P4 program's HLIR. Resolves the field
// accesses of every action, table and conditional once, so that the graph
// analyses can reason about explicit field sets only.

#ifndef P4GRAPHS_IR_HLIR_H_
#define P4GRAPHS_IR_HLIR_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "p4graphs/ir/fields.h"
#include "p4graphs/ir/ir.pb.h"
#include "p4graphs/ir/primitives.h"
#include "p4graphs/util/ordered_map.h"

namespace p4graphs::ir {

// A special control name indicating the end of execution in a pipeline. An
// empty next control means the same.
inline std::string EndOfPipeline() { return "__END_OF_PIPELINE__"; }

// A special parse state name indicating the end of the parser.
inline std::string EndOfParser() { return "__END_OF_PARSER__"; }

// Special keys of `Table::next_tables` selecting the next control on a table
// hit or miss rather than on the executed action.
inline std::string TableHitAction() { return "__HIT__"; }
inline std::string TableMissAction() { return "__MISS__"; }

// Returns true if `control_name` ends a pipeline.
bool IsEndOfPipeline(absl::string_view control_name);

// Names starting with '$' are reserved for pseudo-fields and for the synthetic
// nodes of exported graphs. Controls and parse states may not use them.
bool IsReservedName(absl::string_view name);

// The fields an IR entity may read and may write.
struct FieldAccesses {
  FieldSet reads;
  FieldSet writes;
};

enum class ControlKind { kTable, kConditional };

class Hlir {
 public:
  struct HeaderInstanceInfo {
    const HeaderInstance *instance;
    const HeaderType *type;
  };

  struct ActionInfo {
    const Action *action;
    // Accesses of the action body, compound action calls included.
    FieldAccesses accesses;
    // Total width of the action's parameters (action data), in bits.
    int data_width = 0;
  };

  struct TableInfo {
    const Table *table;
    // Fields read by the match key.
    FieldSet key_reads;
    // Union of the accesses of all candidate actions.
    FieldAccesses action_accesses;
    // Total width of the match key, in bits.
    int key_width = 0;
    // Widest action data among the candidate actions, in bits.
    int action_data_width = 0;
  };

  struct ConditionalInfo {
    const Conditional *conditional;
    // Fields read by the condition.
    FieldSet reads;
  };

  // Validates `program` and resolves all field accesses. Returns a
  // StructuralError if the program is malformed: duplicate or dangling names,
  // unknown fields, unknown primitives, recursive compound actions, or field
  // writes without a determinable writer scope.
  static absl::StatusOr<std::unique_ptr<Hlir>> Create(
      P4Program program, const PrimitiveTable &primitives);

  const P4Program &program() const { return program_; }

  const OrderedMap<HeaderInstanceInfo> &header_instances() const {
    return header_instances_;
  }
  const OrderedMap<ActionInfo> &actions() const { return actions_; }
  const OrderedMap<TableInfo> &tables() const { return tables_; }
  const OrderedMap<ConditionalInfo> &conditionals() const {
    return conditionals_;
  }
  const OrderedMap<const Pipeline *> &pipelines() const { return pipelines_; }
  const OrderedMap<const Parser *> &parsers() const { return parsers_; }

  // Returns the kind of the table or conditional named `control_name`, or a
  // NotFoundError.
  absl::StatusOr<ControlKind> GetControlKind(
      absl::string_view control_name) const;

  // Returns the bit width of a field given in "<header>.<field>" form. The
  // validity bit is one bit wide.
  absl::StatusOr<int> GetFieldWidth(absl::string_view qualified_field) const;

  // Disallow copy and move (for pointer stability of the views above).
  Hlir(const Hlir &) = delete;
  Hlir(Hlir &&) = delete;
  Hlir &operator=(const Hlir &) = delete;
  Hlir &operator=(Hlir &&) = delete;

 private:
  explicit Hlir(P4Program program) : program_(std::move(program)) {}

  absl::Status IndexHeaders();
  absl::Status IndexActions(const PrimitiveTable &primitives);
  absl::Status IndexControls();
  absl::Status IndexPipelinesAndParsers();

  // Adds the fields read by `expression` to `fields`.
  absl::Status CollectExpressionReads(const Expression &expression,
                                      FieldSet &fields) const;

  P4Program program_;
  OrderedMap<HeaderInstanceInfo> header_instances_;
  OrderedMap<ActionInfo> actions_;
  OrderedMap<TableInfo> tables_;
  OrderedMap<ConditionalInfo> conditionals_;
  OrderedMap<const Pipeline *> pipelines_;
  OrderedMap<const Parser *> parsers_;
};

}  // namespace p4graphs::ir

#endif  // P4GRAPHS_IR_HLIR_H_
