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

#ifndef P4GRAPHS_UTIL_IO_H_
#define P4GRAPHS_UTIL_IO_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace p4graphs {

// Reads the entire content of the file and returns it (or an error status).
absl::StatusOr<std::string> ReadFile(const std::string &path);

// Writes the content of the string to the file.
absl::Status WriteFile(const std::string &content, const std::string &path);

// Returns a ConfigurationError unless `path` names an existing, writable
// directory.
absl::Status ValidateOutputDirectory(const std::string &path);

// Joins a directory and a file name with exactly one separator.
std::string JoinPath(absl::string_view directory, absl::string_view file_name);

// Returns true if `name` is a single path component: non-empty, not "." or
// "..", and free of separators and NUL characters.
bool IsPlainFileName(absl::string_view name);

}  // namespace p4graphs

#endif  // P4GRAPHS_UTIL_IO_H_
