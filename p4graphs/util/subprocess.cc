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

#include "p4graphs/util/subprocess.h"

#include <stdio.h>
#include <sys/wait.h>

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/string_view.h"
#include "p4graphs/util/status.h"

namespace p4graphs {

absl::StatusOr<CommandResult> RunCommand(absl::string_view command) {
  FILE* in;
  char buff[1024];
  const std::string command_string(command);
  if (!(in = popen(command_string.c_str(), "r"))) {
    return UnavailableErrorBuilder() << "Failed to run command: " << command;
  }
  CommandResult result;
  while (fgets(buff, sizeof(buff), in) != nullptr) {
    absl::StrAppend(&result.output, buff);
  }
  int status = pclose(in);
  if (status == -1) {
    return UnavailableErrorBuilder()
           << "Failed to collect exit status of command: " << command;
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

std::string ShellQuote(absl::string_view argument) {
  return absl::StrCat("'", absl::StrReplaceAll(argument, {{"'", "'\\''"}}),
                      "'");
}

}  // namespace p4graphs
