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

#include "p4graphs/ir/hlir.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "p4graphs/ir/fields.h"
#include "p4graphs/ir/primitives.h"
#include "p4graphs/util/status.h"

namespace p4graphs::ir {

namespace {

using HeaderInstances = OrderedMap<Hlir::HeaderInstanceInfo>;

const HeaderField *FindHeaderField(const HeaderType &type,
                                   absl::string_view name) {
  for (const HeaderField &field : type.fields()) {
    if (field.name() == name) return &field;
  }
  return nullptr;
}

absl::Status CheckFieldRef(const HeaderInstances &headers,
                           const FieldRef &field) {
  const Hlir::HeaderInstanceInfo *header = headers.Find(field.header());
  if (header == nullptr) {
    return StructuralErrorBuilder()
           << "Unknown header instance '" << field.header()
           << "' in field reference '" << QualifiedFieldName(field) << "'.";
  }
  if (field.field() == kValidityFieldName) {
    if (header->instance->metadata()) {
      return StructuralErrorBuilder()
             << "Metadata instance '" << field.header()
             << "' has no validity bit.";
    }
    return absl::OkStatus();
  }
  if (FindHeaderField(*header->type, field.field()) == nullptr) {
    return StructuralErrorBuilder()
           << "Header instance '" << field.header() << "' of type '"
           << header->type->name() << "' has no field '" << field.field()
           << "'.";
  }
  return absl::OkStatus();
}

// Adds every field of `header`, and its validity bit, to `fields`.
absl::Status CollectHeaderFields(const HeaderInstances &headers,
                                 absl::string_view header, FieldSet &fields) {
  const Hlir::HeaderInstanceInfo *info = headers.Find(header);
  if (info == nullptr) {
    return StructuralErrorBuilder()
           << "Unknown header instance '" << header << "'.";
  }
  for (const HeaderField &field : info->type->fields()) {
    fields.insert(QualifiedFieldName(header, field.name()));
  }
  if (!info->instance->metadata()) fields.insert(ValidityField(header));
  return absl::OkStatus();
}

bool Reads(Access access) {
  return access == Access::READ || access == Access::READ_WRITE;
}
bool Writes(Access access) {
  return access == Access::WRITE || access == Access::READ_WRITE;
}

// Resolves the field accesses of action bodies through the primitive table,
// inlining calls of compound actions.
class ActionResolver {
 public:
  ActionResolver(
      const HeaderInstances &headers,
      const absl::flat_hash_map<std::string, const Action *> &actions,
      const PrimitiveTable &primitives)
      : headers_(headers), actions_(actions), primitives_(primitives) {}

  absl::StatusOr<FieldAccesses> Resolve(const Action &action) {
    FieldAccesses accesses;
    std::vector<std::string> call_stack;
    RETURN_IF_ERROR(ResolveBody(action, /*bindings=*/{}, call_stack, accesses))
            .SetPrepend()
        << "In action '" << action.name() << "': ";
    return accesses;
  }

 private:
  // Maps parameters of a called compound action to the caller's arguments.
  using Bindings = absl::flat_hash_map<std::string, PrimitiveArgument>;

  absl::Status ResolveBody(const Action &action, const Bindings &bindings,
                           std::vector<std::string> &call_stack,
                           FieldAccesses &accesses) {
    if (std::find(call_stack.begin(), call_stack.end(), action.name()) !=
        call_stack.end()) {
      return StructuralErrorBuilder()
             << "Recursive compound action call: "
             << absl::StrJoin(call_stack, " -> ") << " -> " << action.name();
    }
    call_stack.push_back(action.name());
    absl::flat_hash_set<std::string> parameters;
    for (const ActionParameter &parameter : action.parameters()) {
      parameters.insert(parameter.name());
    }
    for (const PrimitiveCall &call : action.calls()) {
      std::vector<PrimitiveArgument> arguments;
      for (const PrimitiveArgument &argument : call.arguments()) {
        if (argument.has_parameter() &&
            !parameters.contains(argument.parameter())) {
          return StructuralErrorBuilder()
                 << "Call of '" << call.name() << "' uses unknown parameter '"
                 << argument.parameter() << "' of action '" << action.name()
                 << "'.";
        }
        auto bound = argument.has_parameter()
                         ? bindings.find(argument.parameter())
                         : bindings.end();
        arguments.push_back(bound == bindings.end() ? argument : bound->second);
      }
      RETURN_IF_ERROR(
          ResolveCall(call.name(), arguments, call_stack, accesses));
    }
    call_stack.pop_back();
    return absl::OkStatus();
  }

  absl::Status ResolveCall(const std::string &name,
                           const std::vector<PrimitiveArgument> &arguments,
                           std::vector<std::string> &call_stack,
                           FieldAccesses &accesses) {
    if (auto it = actions_.find(name); it != actions_.end()) {
      const Action &callee = *it->second;
      if (callee.parameters_size() != static_cast<int>(arguments.size())) {
        return StructuralErrorBuilder()
               << "Compound action '" << name << "' expects "
               << callee.parameters_size() << " arguments, got "
               << arguments.size() << ".";
      }
      Bindings bindings;
      for (int i = 0; i < callee.parameters_size(); ++i) {
        bindings[callee.parameters(i).name()] = arguments[i];
      }
      return ResolveBody(callee, bindings, call_stack, accesses);
    }

    const PrimitiveDefinition *primitive = primitives_.Find(name);
    if (primitive == nullptr) {
      return StructuralErrorBuilder() << "Unknown primitive '" << name << "'.";
    }
    int mandatory = 0;
    for (const PrimitiveParameter &parameter : primitive->parameters()) {
      if (!parameter.optional()) ++mandatory;
    }
    if (static_cast<int>(arguments.size()) < mandatory ||
        static_cast<int>(arguments.size()) > primitive->parameters_size()) {
      return StructuralErrorBuilder()
             << "Primitive '" << name << "' takes " << mandatory << " to "
             << primitive->parameters_size() << " arguments, got "
             << arguments.size() << ".";
    }
    for (size_t i = 0; i < arguments.size(); ++i) {
      RETURN_IF_ERROR(AddAccess(primitive->parameters(i), arguments[i],
                                accesses))
              .SetPrepend()
          << "In call of '" << name << "': ";
    }
    for (const std::string &field : primitive->implicit_reads()) {
      if (IsDeclared(field)) accesses.reads.insert(field);
    }
    for (const std::string &field : primitive->implicit_writes()) {
      if (IsDeclared(field)) accesses.writes.insert(field);
    }
    return absl::OkStatus();
  }

  absl::Status AddAccess(const PrimitiveParameter &parameter,
                         const PrimitiveArgument &argument,
                         FieldAccesses &accesses) {
    const Access access = parameter.access();
    if (access == Access::NONE) return absl::OkStatus();

    FieldSet fields;
    switch (argument.value_case()) {
      case PrimitiveArgument::kField:
        RETURN_IF_ERROR(CheckFieldRef(headers_, argument.field()));
        fields.insert(QualifiedFieldName(argument.field()));
        break;
      case PrimitiveArgument::kHeader:
        RETURN_IF_ERROR(
            CollectHeaderFields(headers_, argument.header(), fields));
        break;
      case PrimitiveArgument::kParameter:
      case PrimitiveArgument::kConstant:
      case PrimitiveArgument::kObject:
        // Runtime data and constants are not fields: reading them creates no
        // dependency, and writing them has no writer scope.
        if (Writes(access)) {
          return StructuralErrorBuilder()
                 << "Parameter '" << parameter.name()
                 << "' is written but its argument is not a field: "
                 << argument.ShortDebugString();
        }
        return absl::OkStatus();
      case PrimitiveArgument::VALUE_NOT_SET:
        return StructuralErrorBuilder()
               << "Argument for parameter '" << parameter.name()
               << "' is not set.";
    }
    if (Reads(access)) accesses.reads.insert(fields.begin(), fields.end());
    if (Writes(access)) accesses.writes.insert(fields.begin(), fields.end());
    return absl::OkStatus();
  }

  bool IsDeclared(const std::string &qualified_field) const {
    std::pair<std::string, std::string> parts =
        absl::StrSplit(qualified_field, absl::MaxSplits('.', 1));
    FieldRef field;
    field.set_header(parts.first);
    field.set_field(parts.second);
    return CheckFieldRef(headers_, field).ok();
  }

  const HeaderInstances &headers_;
  const absl::flat_hash_map<std::string, const Action *> &actions_;
  const PrimitiveTable &primitives_;
};

absl::Status CheckNextControl(const Hlir &hlir, absl::string_view owner,
                              absl::string_view next) {
  if (IsEndOfPipeline(next)) return absl::OkStatus();
  if (!hlir.GetControlKind(next).ok()) {
    return StructuralErrorBuilder()
           << "Control '" << owner << "' refers to unknown next control '"
           << next << "'.";
  }
  return absl::OkStatus();
}

}  // namespace

bool IsEndOfPipeline(absl::string_view control_name) {
  return control_name.empty() || control_name == EndOfPipeline();
}

bool IsReservedName(absl::string_view name) {
  return absl::StartsWith(name, "$");
}

absl::StatusOr<std::unique_ptr<Hlir>> Hlir::Create(
    P4Program program, const PrimitiveTable &primitives) {
  // Using `new` to access a non-public constructor.
  auto hlir = absl::WrapUnique(new Hlir(std::move(program)));
  RETURN_IF_ERROR(hlir->IndexHeaders());
  RETURN_IF_ERROR(hlir->IndexActions(primitives));
  RETURN_IF_ERROR(hlir->IndexControls());
  RETURN_IF_ERROR(hlir->IndexPipelinesAndParsers());
  return std::move(hlir);
}

absl::Status Hlir::IndexHeaders() {
  absl::flat_hash_map<std::string, const HeaderType *> types;
  for (const HeaderType &type : program_.header_types()) {
    if (!types.insert({type.name(), &type}).second) {
      return StructuralErrorBuilder()
             << "Duplicate header type '" << type.name() << "'.";
    }
    absl::flat_hash_set<std::string> field_names;
    for (const HeaderField &field : type.fields()) {
      if (field.name() == kValidityFieldName ||
          !field_names.insert(field.name()).second) {
        return StructuralErrorBuilder()
               << "Invalid or duplicate field '" << field.name()
               << "' in header type '" << type.name() << "'.";
      }
      if (field.bitwidth() <= 0) {
        return StructuralErrorBuilder()
               << "Field '" << type.name() << "." << field.name()
               << "' has non-positive width " << field.bitwidth() << ".";
      }
    }
  }
  for (const HeaderInstance &instance : program_.header_instances()) {
    auto type = types.find(instance.header_type());
    if (type == types.end()) {
      return StructuralErrorBuilder()
             << "Header instance '" << instance.name()
             << "' has unknown type '" << instance.header_type() << "'.";
    }
    if (!header_instances_.Insert(
            instance.name(), HeaderInstanceInfo{&instance, type->second})) {
      return StructuralErrorBuilder()
             << "Duplicate header instance '" << instance.name() << "'.";
    }
  }
  return absl::OkStatus();
}

absl::Status Hlir::IndexActions(const PrimitiveTable &primitives) {
  absl::flat_hash_map<std::string, const Action *> actions_by_name;
  for (const Action &action : program_.actions()) {
    if (!actions_by_name.insert({action.name(), &action}).second) {
      return StructuralErrorBuilder()
             << "Duplicate action '" << action.name() << "'.";
    }
  }

  ActionResolver resolver(header_instances_, actions_by_name, primitives);
  for (const Action &action : program_.actions()) {
    ActionInfo info{&action};
    ASSIGN_OR_RETURN(info.accesses, resolver.Resolve(action));
    absl::flat_hash_set<std::string> parameter_names;
    for (const ActionParameter &parameter : action.parameters()) {
      if (!parameter_names.insert(parameter.name()).second) {
        return StructuralErrorBuilder()
               << "Duplicate parameter '" << parameter.name()
               << "' in action '" << action.name() << "'.";
      }
      info.data_width += parameter.bitwidth();
    }
    actions_.Insert(action.name(), std::move(info));
  }
  return absl::OkStatus();
}

absl::Status Hlir::IndexControls() {
  for (const Table &table : program_.tables()) {
    if (IsEndOfPipeline(table.name()) || IsReservedName(table.name()) ||
        !tables_.Insert(table.name(), TableInfo{&table})) {
      return StructuralErrorBuilder()
             << "Invalid or duplicate table name '" << table.name() << "'.";
    }
  }
  for (const Conditional &conditional : program_.conditionals()) {
    if (IsEndOfPipeline(conditional.name()) ||
        IsReservedName(conditional.name()) ||
        tables_.contains(conditional.name()) ||
        !conditionals_.Insert(conditional.name(),
                              ConditionalInfo{&conditional})) {
      return StructuralErrorBuilder() << "Invalid or duplicate control name '"
                                      << conditional.name() << "'.";
    }
  }

  // Resolve field accesses. All control names are known at this point, so
  // next controls can be checked as well.
  for (const Table &table : program_.tables()) {
    const std::string &name = table.name();
    TableInfo &info = *tables_.FindMutable(name);
    for (const MatchKey &key : table.keys()) {
      if (key.match_type() == MatchType::VALID) {
        FieldRef validity;
        validity.set_header(key.field().header());
        validity.set_field(std::string(kValidityFieldName));
        RETURN_IF_ERROR(CheckFieldRef(header_instances_, validity)).SetPrepend()
            << "In key of table '" << name << "': ";
        info.key_reads.insert(QualifiedFieldName(validity));
        info.key_width += 1;
        continue;
      }
      RETURN_IF_ERROR(CheckFieldRef(header_instances_, key.field()))
              .SetPrepend()
          << "In key of table '" << name << "': ";
      info.key_reads.insert(QualifiedFieldName(key.field()));
      ASSIGN_OR_RETURN(int width,
                       GetFieldWidth(QualifiedFieldName(key.field())));
      info.key_width += width;
    }
    for (const std::string &action_name : table.actions()) {
      const ActionInfo *action = actions_.Find(action_name);
      if (action == nullptr) {
        return StructuralErrorBuilder() << "Table '" << name
                                        << "' refers to unknown action '"
                                        << action_name << "'.";
      }
      info.action_accesses.reads.insert(action->accesses.reads.begin(),
                                        action->accesses.reads.end());
      info.action_accesses.writes.insert(action->accesses.writes.begin(),
                                         action->accesses.writes.end());
      info.action_data_width =
          std::max(info.action_data_width, action->data_width);
    }
    if (!table.default_action().empty() &&
        std::find(table.actions().begin(), table.actions().end(),
                  table.default_action()) == table.actions().end()) {
      return StructuralErrorBuilder()
             << "Default action '" << table.default_action() << "' of table '"
             << name << "' is not one of its actions.";
    }
    for (const auto &[outcome, next] : table.next_tables()) {
      if (outcome != TableHitAction() && outcome != TableMissAction() &&
          std::find(table.actions().begin(), table.actions().end(),
                    outcome) == table.actions().end()) {
        return StructuralErrorBuilder()
               << "Table '" << name << "' has a next control for '" << outcome
               << "', which is neither one of its actions nor hit/miss.";
      }
      RETURN_IF_ERROR(CheckNextControl(*this, name, next));
    }
    RETURN_IF_ERROR(CheckNextControl(*this, name, table.base_default_next()));
  }

  for (const Conditional &conditional : program_.conditionals()) {
    const std::string &name = conditional.name();
    ConditionalInfo &info = *conditionals_.FindMutable(name);
    RETURN_IF_ERROR(
        CollectExpressionReads(info.conditional->condition(), info.reads))
            .SetPrepend()
        << "In condition of '" << name << "': ";
    RETURN_IF_ERROR(
        CheckNextControl(*this, name, info.conditional->true_next()));
    RETURN_IF_ERROR(
        CheckNextControl(*this, name, info.conditional->false_next()));
  }
  return absl::OkStatus();
}

absl::Status Hlir::IndexPipelinesAndParsers() {
  for (const Pipeline &pipeline : program_.pipelines()) {
    if (!pipelines_.Insert(pipeline.name(), &pipeline)) {
      return StructuralErrorBuilder()
             << "Duplicate pipeline '" << pipeline.name() << "'.";
    }
    RETURN_IF_ERROR(
        CheckNextControl(*this, pipeline.name(), pipeline.initial_control()));
  }
  for (const Parser &parser : program_.parsers()) {
    if (!parsers_.Insert(parser.name(), &parser)) {
      return StructuralErrorBuilder()
             << "Duplicate parser '" << parser.name() << "'.";
    }
    absl::flat_hash_set<std::string> states;
    for (const ParseState &state : parser.states()) {
      if (IsReservedName(state.name()) ||
          !states.insert(state.name()).second) {
        return StructuralErrorBuilder()
               << "Invalid or duplicate parse state '" << state.name()
               << "' in parser '" << parser.name() << "'.";
      }
    }
    // A parser ends in a dedicated state or hands over to a control.
    auto is_valid_target = [&](const std::string &state) {
      return states.contains(state) || state == EndOfParser() ||
             GetControlKind(state).ok();
    };
    if (!is_valid_target(parser.initial_state())) {
      return StructuralErrorBuilder()
             << "Parser '" << parser.name() << "' has unknown initial state '"
             << parser.initial_state() << "'.";
    }
    for (const ParseState &state : parser.states()) {
      for (const std::string &header : state.extracts()) {
        if (!header_instances_.contains(header)) {
          return StructuralErrorBuilder()
                 << "Parse state '" << state.name()
                 << "' extracts unknown header '" << header << "'.";
        }
      }
      for (const FieldRef &field : state.select_fields()) {
        RETURN_IF_ERROR(CheckFieldRef(header_instances_, field)).SetPrepend()
            << "In select of parse state '" << state.name() << "': ";
      }
      for (const ParserTransition &transition : state.transitions()) {
        if (!is_valid_target(transition.next_state())) {
          return StructuralErrorBuilder()
                 << "Parse state '" << state.name()
                 << "' transitions to unknown state '"
                 << transition.next_state() << "'.";
        }
      }
    }
  }
  return absl::OkStatus();
}

absl::Status Hlir::CollectExpressionReads(const Expression &expression,
                                          FieldSet &fields) const {
  switch (expression.value_case()) {
    case Expression::kField:
      RETURN_IF_ERROR(CheckFieldRef(header_instances_, expression.field()));
      fields.insert(QualifiedFieldName(expression.field()));
      return absl::OkStatus();
    case Expression::kValidHeader: {
      FieldRef validity;
      validity.set_header(expression.valid_header());
      validity.set_field(std::string(kValidityFieldName));
      RETURN_IF_ERROR(CheckFieldRef(header_instances_, validity));
      fields.insert(QualifiedFieldName(validity));
      return absl::OkStatus();
    }
    case Expression::kUnary:
      return CollectExpressionReads(expression.unary().operand(), fields);
    case Expression::kBinary:
      RETURN_IF_ERROR(
          CollectExpressionReads(expression.binary().left(), fields));
      return CollectExpressionReads(expression.binary().right(), fields);
    case Expression::kConstant:
    case Expression::kBoolean:
      return absl::OkStatus();
    case Expression::VALUE_NOT_SET:
      break;
  }
  return StructuralErrorBuilder() << "Expression without a value.";
}

absl::StatusOr<ControlKind> Hlir::GetControlKind(
    absl::string_view control_name) const {
  if (tables_.contains(control_name)) return ControlKind::kTable;
  if (conditionals_.contains(control_name)) return ControlKind::kConditional;
  return NotFoundErrorBuilder() << "Unknown control '" << control_name << "'.";
}

absl::StatusOr<int> Hlir::GetFieldWidth(
    absl::string_view qualified_field) const {
  std::pair<std::string, std::string> parts =
      absl::StrSplit(qualified_field, absl::MaxSplits('.', 1));
  const HeaderInstanceInfo *header = header_instances_.Find(parts.first);
  if (header == nullptr) {
    return NotFoundErrorBuilder()
           << "Unknown header instance in field '" << qualified_field << "'.";
  }
  if (parts.second == kValidityFieldName) return 1;
  const HeaderField *field = FindHeaderField(*header->type, parts.second);
  if (field == nullptr) {
    return NotFoundErrorBuilder() << "Unknown field '" << qualified_field
                                  << "'.";
  }
  return field->bitwidth();
}

}  // namespace p4graphs::ir
