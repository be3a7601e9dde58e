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

// Field identities and the "may overlap" reasoning used by the dependency
// analysis. Fields are identified by their fully qualified name
// "<header instance>.<field>"; the validity bit of a header instance is the
// pseudo-field "<header instance>.$valid".
//
// Everything here is a pure function of explicit field sets, independent of
// the IR they were collected from.

#ifndef P4GRAPHS_IR_FIELDS_H_
#define P4GRAPHS_IR_FIELDS_H_

#include <string>

#include "absl/container/btree_set.h"
#include "absl/strings/string_view.h"
#include "p4graphs/ir/ir.pb.h"

namespace p4graphs::ir {

// Ordered so that labels and comparisons are deterministic.
using FieldSet = absl::btree_set<std::string>;

// Name of the validity pseudo-field of every (non-metadata) header instance.
inline constexpr absl::string_view kValidityFieldName = "$valid";

std::string QualifiedFieldName(absl::string_view header,
                               absl::string_view field);
std::string QualifiedFieldName(const FieldRef &field);
std::string ValidityField(absl::string_view header);

// Returns true iff the two sets share at least one field. Linear in the size
// of the sets.
bool MayOverlap(const FieldSet &a, const FieldSet &b);

// Returns the fields present in both sets.
FieldSet Intersection(const FieldSet &a, const FieldSet &b);

// Returns the fields present in either set.
FieldSet Union(const FieldSet &a, const FieldSet &b);

// "{a.x, b.y}".
std::string ToString(const FieldSet &fields);

}  // namespace p4graphs::ir

#endif  // P4GRAPHS_IR_FIELDS_H_
