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

#include "p4graphs/ir/test_util.h"

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/ir/ir.pb.h"
#include "p4graphs/ir/primitives.h"
#include "p4graphs/util/proto.h"
#include "p4graphs/util/status.h"

namespace p4graphs::ir {

std::string CommonDeclarations() {
  return R"pb(
    header_types {
      name: "ethernet_t"
      fields { name: "dst_addr" bitwidth: 48 }
      fields { name: "src_addr" bitwidth: 48 }
      fields { name: "ether_type" bitwidth: 16 }
    }
    header_types {
      name: "ipv4_t"
      fields { name: "src_addr" bitwidth: 32 }
      fields { name: "dst_addr" bitwidth: 32 }
      fields { name: "ttl" bitwidth: 8 }
    }
    header_types {
      name: "meta_t"
      fields { name: "a" bitwidth: 8 }
      fields { name: "b" bitwidth: 8 }
      fields { name: "c" bitwidth: 8 }
      fields { name: "d" bitwidth: 8 }
    }
    header_types {
      name: "standard_metadata_t"
      fields { name: "egress_spec" bitwidth: 9 }
      fields { name: "ingress_port" bitwidth: 9 }
    }
    header_instances { name: "ethernet" header_type: "ethernet_t" }
    header_instances { name: "ipv4" header_type: "ipv4_t" }
    header_instances { name: "meta" header_type: "meta_t" metadata: true }
    header_instances {
      name: "standard_metadata"
      header_type: "standard_metadata_t"
      metadata: true
    }
    actions {
      name: "nop"
      calls { name: "no_op" }
    }
    actions {
      name: "set_a"
      parameters { name: "value" bitwidth: 8 }
      calls {
        name: "modify_field"
        arguments { field { header: "meta" field: "a" } }
        arguments { parameter: "value" }
      }
    }
    actions {
      name: "set_b"
      parameters { name: "value" bitwidth: 8 }
      calls {
        name: "modify_field"
        arguments { field { header: "meta" field: "b" } }
        arguments { parameter: "value" }
      }
    }
    actions {
      name: "copy_a_to_c"
      calls {
        name: "modify_field"
        arguments { field { header: "meta" field: "c" } }
        arguments { field { header: "meta" field: "a" } }
      }
    }
    actions {
      name: "copy_c_to_d"
      calls {
        name: "modify_field"
        arguments { field { header: "meta" field: "d" } }
        arguments { field { header: "meta" field: "c" } }
      }
    }
  )pb";
}

absl::StatusOr<P4Program> ParseProgram(absl::string_view program_text) {
  return ParseTextProto<P4Program>(
      absl::StrCat(CommonDeclarations(), program_text));
}

absl::StatusOr<std::unique_ptr<Hlir>> ParseHlir(
    absl::string_view program_text) {
  ASSIGN_OR_RETURN(P4Program program, ParseProgram(program_text));
  ASSIGN_OR_RETURN(PrimitiveTable primitives,
                   PrimitiveTable::CreateWithBuiltIns());
  return Hlir::Create(std::move(program), primitives);
}

std::string SequentialTablesProgram() {
  return R"pb(
    tables {
      name: "t1"
      keys {
        field { header: "ethernet" field: "dst_addr" }
        match_type: EXACT
      }
      actions: "set_a"
      base_default_next: "t2"
    }
    tables {
      name: "t2"
      keys {
        field { header: "meta" field: "a" }
        match_type: EXACT
      }
      actions: "nop"
      base_default_next: "t3"
    }
    tables {
      name: "t3"
      keys {
        field { header: "ethernet" field: "ether_type" }
        match_type: EXACT
      }
      actions: "nop"
    }
    pipelines { name: "ingress" initial_control: "t1" }
  )pb";
}

std::string IndependentTablesProgram() {
  return R"pb(
    tables {
      name: "t1"
      keys {
        field { header: "ethernet" field: "dst_addr" }
        match_type: EXACT
      }
      actions: "nop"
    }
    tables {
      name: "t2"
      keys {
        field { header: "ethernet" field: "ether_type" }
        match_type: EXACT
      }
      actions: "nop"
    }
  )pb";
}

std::string ConditionalProgram() {
  return R"pb(
    tables {
      name: "t1"
      keys {
        field { header: "ethernet" field: "dst_addr" }
        match_type: EXACT
      }
      actions: "set_a"
      base_default_next: "c1"
    }
    conditionals {
      name: "c1"
      condition {
        binary {
          op: "=="
          left { field { header: "meta" field: "a" } }
          right { constant: "1" }
        }
      }
      true_next: "t2"
      false_next: "t3"
    }
    tables {
      name: "t2"
      keys {
        field { header: "ethernet" field: "src_addr" }
        match_type: EXACT
      }
      actions: "nop"
    }
    tables {
      name: "t3"
      keys {
        field { header: "ethernet" field: "ether_type" }
        match_type: TERNARY
      }
      actions: "nop"
    }
    pipelines { name: "ingress" initial_control: "t1" }
  )pb";
}

std::string TransitiveProgram() {
  return R"pb(
    tables {
      name: "t1"
      keys {
        field { header: "ethernet" field: "dst_addr" }
        match_type: EXACT
      }
      actions: "set_a"
      base_default_next: "t2"
    }
    tables {
      name: "t2"
      keys {
        field { header: "meta" field: "a" }
        match_type: EXACT
      }
      actions: "set_b"
      base_default_next: "t3"
    }
    tables {
      name: "t3"
      keys {
        field { header: "meta" field: "a" }
        match_type: EXACT
      }
      keys {
        field { header: "meta" field: "b" }
        match_type: EXACT
      }
      actions: "nop"
    }
    pipelines { name: "ingress" initial_control: "t1" }
  )pb";
}

std::string DiamondProgram() {
  return R"pb(
    tables {
      name: "t1"
      keys {
        field { header: "ethernet" field: "dst_addr" }
        match_type: EXACT
      }
      actions: "set_a"
      base_default_next: "c1"
    }
    conditionals {
      name: "c1"
      condition { valid_header: "ipv4" }
      true_next: "t2"
      false_next: "t3"
    }
    tables {
      name: "t2"
      keys {
        field { header: "meta" field: "a" }
        match_type: EXACT
      }
      actions: "copy_a_to_c"
      base_default_next: "t4"
    }
    tables {
      name: "t3"
      keys {
        field { header: "ethernet" field: "ether_type" }
        match_type: EXACT
      }
      actions: "set_b"
      base_default_next: "t4"
    }
    tables {
      name: "t4"
      keys {
        field { header: "meta" field: "a" }
        match_type: EXACT
      }
      keys {
        field { header: "meta" field: "b" }
        match_type: EXACT
      }
      keys {
        field { header: "meta" field: "c" }
        match_type: EXACT
      }
      actions: "nop"
    }
    pipelines { name: "ingress" initial_control: "t1" }
  )pb";
}

}  // namespace p4graphs::ir
