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

#include "p4graphs/util/io.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <streambuf>
#include <string>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "p4graphs/util/status.h"

namespace p4graphs {

namespace {

absl::Status ErrorNoToAbsl(const char *operation, const std::string &path) {
  switch (errno) {
    case EACCES:
    case ENOENT:
      return absl::NotFoundError(
          absl::StrFormat("%s: %s", strerror(errno), path));
    default:
      return absl::UnknownError(absl::StrFormat("Cannot %s file %s, errno = %d",
                                                operation, path, errno));
  }
}

}  // namespace

absl::StatusOr<std::string> ReadFile(const std::string &path) {
  std::ifstream f;
  f.open(path.c_str());
  if (f.fail()) {
    return ErrorNoToAbsl("open", path);
  }
  f >> std::noskipws;  // Read whitespaces.
  std::string result(std::istreambuf_iterator<char>(f),
                     (std::istreambuf_iterator<char>()));
  if (f.bad()) {
    return ErrorNoToAbsl("read", path);
  }
  f.close();
  return result;
}

absl::Status WriteFile(const std::string &content, const std::string &path) {
  std::ofstream f;
  f.open(path.c_str());
  if (f.fail()) {
    return ErrorNoToAbsl("open", path);
  }
  f << content;
  f.close();
  if (f.bad()) {
    return ErrorNoToAbsl("write", path);
  }
  return absl::OkStatus();
}

absl::Status ValidateOutputDirectory(const std::string &path) {
  if (path.empty()) {
    return ConfigurationErrorBuilder() << "No output directory was given.";
  }
  struct stat info;
  if (stat(path.c_str(), &info) != 0) {
    return ConfigurationErrorBuilder()
           << "Output directory '" << path << "' does not exist: "
           << strerror(errno);
  }
  if (!S_ISDIR(info.st_mode)) {
    return ConfigurationErrorBuilder()
           << "Output path '" << path << "' is not a directory.";
  }
  if (access(path.c_str(), W_OK) != 0) {
    return ConfigurationErrorBuilder()
           << "Output directory '" << path << "' is not writable.";
  }
  return absl::OkStatus();
}

std::string JoinPath(absl::string_view directory, absl::string_view file_name) {
  if (directory.empty()) return std::string(file_name);
  if (absl::EndsWith(directory, "/")) return absl::StrCat(directory, file_name);
  return absl::StrCat(directory, "/", file_name);
}

bool IsPlainFileName(absl::string_view name) {
  return !name.empty() && name != "." && name != ".." &&
         !absl::StrContains(name, '/') && !absl::StrContains(name, '\0');
}

}  // namespace p4graphs
