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

#include "p4graphs/ir/primitives.h"

#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "p4graphs/ir/primitives.pb.h"
#include "p4graphs/util/proto.h"
#include "p4graphs/util/status.h"

namespace p4graphs::ir {

namespace {

// The P4-14 primitive actions.
constexpr char kBuiltInPrimitives[] = R"pb(
  primitives {
    name: "modify_field"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src" access: READ }
    parameters { name: "mask" access: READ optional: true }
  }
  primitives {
    name: "add_to_field"
    parameters { name: "field" access: READ_WRITE }
    parameters { name: "value" access: READ }
  }
  primitives {
    name: "subtract_from_field"
    parameters { name: "field" access: READ_WRITE }
    parameters { name: "value" access: READ }
  }
  primitives {
    name: "add"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src1" access: READ }
    parameters { name: "src2" access: READ }
  }
  primitives {
    name: "subtract"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src1" access: READ }
    parameters { name: "src2" access: READ }
  }
  primitives {
    name: "bit_and"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src1" access: READ }
    parameters { name: "src2" access: READ }
  }
  primitives {
    name: "bit_or"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src1" access: READ }
    parameters { name: "src2" access: READ }
  }
  primitives {
    name: "bit_xor"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src1" access: READ }
    parameters { name: "src2" access: READ }
  }
  primitives {
    name: "shift_left"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src" access: READ }
    parameters { name: "shift" access: READ }
  }
  primitives {
    name: "shift_right"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src" access: READ }
    parameters { name: "shift" access: READ }
  }
  primitives {
    name: "add_header"
    parameters { name: "header" access: WRITE }
  }
  primitives {
    name: "remove_header"
    parameters { name: "header" access: WRITE }
  }
  primitives {
    name: "copy_header"
    parameters { name: "dst" access: WRITE }
    parameters { name: "src" access: READ }
  }
  primitives {
    name: "push"
    parameters { name: "header_stack" access: READ_WRITE }
    parameters { name: "count" access: READ optional: true }
  }
  primitives {
    name: "pop"
    parameters { name: "header_stack" access: READ_WRITE }
    parameters { name: "count" access: READ optional: true }
  }
  primitives {
    name: "drop"
    implicit_writes: "standard_metadata.egress_spec"
  }
  primitives { name: "no_op" }
  primitives {
    name: "count"
    parameters { name: "counter_ref" access: NONE }
    parameters { name: "index" access: READ }
  }
  primitives {
    name: "execute_meter"
    parameters { name: "meter_ref" access: NONE }
    parameters { name: "index" access: READ }
    parameters { name: "field" access: WRITE }
  }
  primitives {
    name: "register_read"
    parameters { name: "dst" access: WRITE }
    parameters { name: "register_ref" access: NONE }
    parameters { name: "index" access: READ }
  }
  primitives {
    name: "register_write"
    parameters { name: "register_ref" access: NONE }
    parameters { name: "index" access: READ }
    parameters { name: "value" access: READ }
  }
  primitives {
    name: "modify_field_with_hash_based_offset"
    parameters { name: "dst" access: WRITE }
    parameters { name: "base" access: READ }
    parameters { name: "hash" access: NONE }
    parameters { name: "size" access: READ }
  }
  primitives {
    name: "modify_field_rng_uniform"
    parameters { name: "dst" access: WRITE }
    parameters { name: "lower_bound" access: READ }
    parameters { name: "upper_bound" access: READ }
  }
  primitives {
    name: "generate_digest"
    parameters { name: "receiver" access: READ }
    parameters { name: "field_list" access: NONE }
  }
  primitives {
    name: "resubmit"
    parameters { name: "field_list" access: NONE optional: true }
  }
  primitives {
    name: "recirculate"
    parameters { name: "field_list" access: NONE }
  }
  primitives {
    name: "clone_ingress_pkt_to_egress"
    parameters { name: "clone_spec" access: READ }
    parameters { name: "field_list" access: NONE optional: true }
  }
  primitives {
    name: "clone_egress_pkt_to_egress"
    parameters { name: "clone_spec" access: READ }
    parameters { name: "field_list" access: NONE optional: true }
  }
  primitives {
    name: "truncate"
    parameters { name: "length" access: READ }
  }
)pb";

absl::Status ValidateDefinition(const PrimitiveDefinition &definition) {
  if (definition.name().empty()) {
    return ConfigurationErrorBuilder()
           << "Primitive definition without a name: "
           << PrintShortTextProto(definition);
  }
  absl::flat_hash_set<std::string> parameter_names;
  bool seen_optional = false;
  for (const PrimitiveParameter &parameter : definition.parameters()) {
    if (!parameter_names.insert(parameter.name()).second) {
      return ConfigurationErrorBuilder()
             << "Primitive '" << definition.name()
             << "' has duplicate parameter '" << parameter.name() << "'.";
    }
    if (parameter.access() == ACCESS_UNSPECIFIED) {
      return ConfigurationErrorBuilder()
             << "Parameter '" << parameter.name() << "' of primitive '"
             << definition.name() << "' has no access specified.";
    }
    if (seen_optional && !parameter.optional()) {
      return ConfigurationErrorBuilder()
             << "Primitive '" << definition.name()
             << "' declares mandatory parameter '" << parameter.name()
             << "' after an optional one.";
    }
    seen_optional = seen_optional || parameter.optional();
  }
  for (const auto &fields :
       {definition.implicit_reads(), definition.implicit_writes()}) {
    for (const std::string &field : fields) {
      if (!absl::StrContains(field, '.')) {
        return ConfigurationErrorBuilder()
               << "Implicit access '" << field << "' of primitive '"
               << definition.name()
               << "' is not of the form <header>.<field>.";
      }
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<PrimitiveTable> PrimitiveTable::CreateWithBuiltIns() {
  ASSIGN_OR_RETURN(auto built_ins,
                   ParseTextProto<PrimitiveDefinitions>(kBuiltInPrimitives),
                   _.SetCode(absl::StatusCode::kInternal)
                       << "Built-in primitive definitions are malformed.");
  PrimitiveTable table;
  RETURN_IF_ERROR(table.Merge(built_ins));
  return table;
}

absl::Status PrimitiveTable::Merge(const PrimitiveDefinitions &definitions) {
  for (const PrimitiveDefinition &definition : definitions.primitives()) {
    RETURN_IF_ERROR(ValidateDefinition(definition));
  }
  for (const PrimitiveDefinition &definition : definitions.primitives()) {
    definitions_[definition.name()] = definition;
  }
  return absl::OkStatus();
}

const PrimitiveDefinition *PrimitiveTable::Find(absl::string_view name) const {
  auto it = definitions_.find(name);
  if (it == definitions_.end()) return nullptr;
  return &it->second;
}

absl::StatusOr<PrimitiveTable> LoadPrimitiveTable(
    absl::Span<const std::string> paths) {
  ASSIGN_OR_RETURN(PrimitiveTable table, PrimitiveTable::CreateWithBuiltIns());
  for (const std::string &path : paths) {
    PrimitiveDefinitions definitions;
    RETURN_IF_ERROR(ReadProtoFromFile(path, &definitions))
            .SetCode(absl::StatusCode::kInvalidArgument)
        << "Cannot load primitive definitions";
    RETURN_IF_ERROR(table.Merge(definitions)).SetPrepend()
        << "In primitive definitions '" << path << "': ";
    LOG(INFO) << "Loaded " << definitions.primitives_size()
              << " primitive definitions from " << path;
  }
  return table;
}

}  // namespace p4graphs::ir
