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

#ifndef P4GRAPHS_UTIL_SUBPROCESS_H_
#define P4GRAPHS_UTIL_SUBPROCESS_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace p4graphs {

// Output of a finished shell command.
struct CommandResult {
  int exit_code = 0;
  // Combined stdout of the command. Callers that need stderr redirect it.
  std::string output;
};

// Runs `command` through the shell and blocks until it exits. Returns an
// UnavailableError if the shell itself could not be started; a non-zero exit
// code of the command is reported through `CommandResult::exit_code`.
absl::StatusOr<CommandResult> RunCommand(absl::string_view command);

// Quotes `argument` for safe use as a single shell word.
std::string ShellQuote(absl::string_view argument);

}  // namespace p4graphs

#endif  // P4GRAPHS_UTIL_SUBPROCESS_H_
