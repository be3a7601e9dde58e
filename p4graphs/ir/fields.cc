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

#include "p4graphs/ir/fields.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"

namespace p4graphs::ir {

std::string QualifiedFieldName(absl::string_view header,
                               absl::string_view field) {
  return absl::StrCat(header, ".", field);
}

std::string QualifiedFieldName(const FieldRef &field) {
  return QualifiedFieldName(field.header(), field.field());
}

std::string ValidityField(absl::string_view header) {
  return QualifiedFieldName(header, kValidityFieldName);
}

bool MayOverlap(const FieldSet &a, const FieldSet &b) {
  auto it_a = a.begin();
  auto it_b = b.begin();
  while (it_a != a.end() && it_b != b.end()) {
    if (*it_a == *it_b) return true;
    if (*it_a < *it_b) {
      ++it_a;
    } else {
      ++it_b;
    }
  }
  return false;
}

FieldSet Intersection(const FieldSet &a, const FieldSet &b) {
  const FieldSet &smaller = a.size() <= b.size() ? a : b;
  const FieldSet &larger = a.size() <= b.size() ? b : a;
  FieldSet result;
  for (const std::string &field : smaller) {
    if (larger.contains(field)) result.insert(field);
  }
  return result;
}

FieldSet Union(const FieldSet &a, const FieldSet &b) {
  FieldSet result = a;
  result.insert(b.begin(), b.end());
  return result;
}

std::string ToString(const FieldSet &fields) {
  return absl::StrCat("{", absl::StrJoin(fields, ", "), "}");
}

}  // namespace p4graphs::ir
