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
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "p4graphs/ir/primitives.pb.h"
#include "p4graphs/util/io.h"
#include "p4graphs/util/status_matchers.h"
#include "p4graphs/util/testing.h"

namespace p4graphs::ir {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::NotNull;

TEST(PrimitiveTableTest, BuiltInsDescribeP414Primitives) {
  ASSERT_OK_AND_ASSIGN(PrimitiveTable table,
                       PrimitiveTable::CreateWithBuiltIns());
  for (const char *name :
       {"modify_field", "add_to_field", "subtract_from_field", "add",
        "bit_and", "shift_left", "add_header", "remove_header", "copy_header",
        "drop", "no_op", "count", "execute_meter", "register_read",
        "register_write", "modify_field_with_hash_based_offset",
        "generate_digest", "resubmit", "recirculate",
        "clone_ingress_pkt_to_egress", "clone_egress_pkt_to_egress",
        "truncate", "push", "pop"}) {
    EXPECT_THAT(table.Find(name), NotNull()) << name;
  }
  EXPECT_EQ(table.Find("frobnicate"), nullptr);

  const PrimitiveDefinition *modify_field = table.Find("modify_field");
  ASSERT_THAT(modify_field, NotNull());
  ASSERT_EQ(modify_field->parameters_size(), 3);
  EXPECT_EQ(modify_field->parameters(0).access(), WRITE);
  EXPECT_EQ(modify_field->parameters(1).access(), READ);
  EXPECT_TRUE(modify_field->parameters(2).optional());

  const PrimitiveDefinition *drop = table.Find("drop");
  ASSERT_THAT(drop, NotNull());
  EXPECT_THAT(drop->implicit_writes(),
              ElementsAre("standard_metadata.egress_spec"));
}

TEST(PrimitiveTableTest, MergeReplacesDefinitionOfSameName) {
  ASSERT_OK_AND_ASSIGN(PrimitiveTable table,
                       PrimitiveTable::CreateWithBuiltIns());
  const size_t size = table.size();
  ASSERT_OK(table.Merge(ParseProtoOrDie<PrimitiveDefinitions>(R"pb(
    primitives {
      name: "no_op"
      implicit_reads: "standard_metadata.ingress_port"
    }
    primitives {
      name: "set_priority"
      parameters { name: "priority" access: WRITE }
    }
  )pb")));
  EXPECT_EQ(table.size(), size + 1);
  EXPECT_THAT(table.Find("no_op")->implicit_reads(),
              ElementsAre("standard_metadata.ingress_port"));
  EXPECT_THAT(table.Find("set_priority"), NotNull());
}

TEST(PrimitiveTableTest, MalformedDefinitionsAreRejectedAtomically) {
  ASSERT_OK_AND_ASSIGN(PrimitiveTable table,
                       PrimitiveTable::CreateWithBuiltIns());
  absl::Status status = table.Merge(ParseProtoOrDie<PrimitiveDefinitions>(R"pb(
    primitives { name: "first" }
    primitives {
      name: "second"
      parameters { name: "x" access: READ }
      parameters { name: "x" access: WRITE }
    }
  )pb"));
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument,
                               HasSubstr("duplicate parameter 'x'")));
  EXPECT_EQ(table.Find("first"), nullptr);
}

TEST(PrimitiveTableTest, RejectsParameterWithoutAccess) {
  PrimitiveTable table;
  EXPECT_TRUE(IsConfigurationError(
      table.Merge(ParseProtoOrDie<PrimitiveDefinitions>(R"pb(
        primitives {
          name: "p"
          parameters { name: "x" }
        }
      )pb"))));
}

TEST(PrimitiveTableTest, RejectsMandatoryParameterAfterOptionalOne) {
  PrimitiveTable table;
  EXPECT_TRUE(IsConfigurationError(
      table.Merge(ParseProtoOrDie<PrimitiveDefinitions>(R"pb(
        primitives {
          name: "p"
          parameters { name: "x" access: READ optional: true }
          parameters { name: "y" access: READ }
        }
      )pb"))));
}

TEST(PrimitiveTableTest, RejectsUnqualifiedImplicitAccess) {
  PrimitiveTable table;
  EXPECT_TRUE(IsConfigurationError(
      table.Merge(ParseProtoOrDie<PrimitiveDefinitions>(R"pb(
        primitives { name: "p" implicit_writes: "egress_spec" }
      )pb"))));
}

TEST(LoadPrimitiveTableTest, MergesFilesInOrder) {
  const std::string first = JoinPath(testing::TempDir(), "first.txtpb");
  const std::string second = JoinPath(testing::TempDir(), "second.txtpb");
  ASSERT_OK(WriteFile(R"pb(
                        primitives {
                          name: "custom"
                          implicit_reads: "meta.a"
                        }
                      )pb",
                      first));
  ASSERT_OK(WriteFile(R"pb(
                        primitives {
                          name: "custom"
                          implicit_reads: "meta.b"
                        }
                      )pb",
                      second));
  std::vector<std::string> paths = {first, second};
  ASSERT_OK_AND_ASSIGN(PrimitiveTable table, LoadPrimitiveTable(paths));
  ASSERT_THAT(table.Find("custom"), NotNull());
  EXPECT_THAT(table.Find("custom")->implicit_reads(), ElementsAre("meta.b"));
  EXPECT_THAT(table.Find("modify_field"), NotNull());
}

TEST(LoadPrimitiveTableTest, UnreadableFileIsConfigurationError) {
  std::vector<std::string> paths = {
      JoinPath(testing::TempDir(), "missing.txtpb")};
  EXPECT_TRUE(IsConfigurationError(LoadPrimitiveTable(paths).status()));
}

TEST(LoadPrimitiveTableTest, MalformedFileIsConfigurationError) {
  const std::string path = JoinPath(testing::TempDir(), "malformed.txtpb");
  ASSERT_OK(WriteFile("primitives { name: ", path));
  std::vector<std::string> paths = {path};
  EXPECT_TRUE(IsConfigurationError(LoadPrimitiveTable(paths).status()));
}

}  // namespace
}  // namespace p4graphs::ir
