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

// This file defines the entry points for loading a P4 program's HLIR, either
// from a text-format P4Program or from the output of an external frontend.

#ifndef P4GRAPHS_IR_FRONTEND_H_
#define P4GRAPHS_IR_FRONTEND_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "p4graphs/ir/hlir.h"
#include "p4graphs/ir/ir.pb.h"
#include "p4graphs/ir/primitives.h"

namespace p4graphs::ir {

struct FrontendOptions {
  // Shell command that prints the text-format P4Program of the P4 source file
  // given as its last argument.
  std::string command;
  // Passed to `command` untouched, before the source file.
  std::string preprocessor_flags;
};

// Reads a text-format P4Program from `hlir_path`.
absl::StatusOr<P4Program> ReadHlirFile(const std::string &hlir_path);

// Runs the frontend on `p4_path` and parses its standard output.
absl::StatusOr<P4Program> RunFrontend(const std::string &p4_path,
                                      const FrontendOptions &options);

// Builds the validated HLIR view of `program`. Parse and validation errors
// are StructuralErrors.
absl::StatusOr<std::unique_ptr<Hlir>> LoadHlir(
    P4Program program, const PrimitiveTable &primitives);

}  // namespace p4graphs::ir

#endif  // P4GRAPHS_IR_FRONTEND_H_
