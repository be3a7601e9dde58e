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

#ifndef P4GRAPHS_UTIL_TESTING_H_
#define P4GRAPHS_UTIL_TESTING_H_

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "p4graphs/util/proto.h"

namespace p4graphs {

template <typename T>
T ParseProtoOrDie(absl::string_view proto_string) {
  T message;
  absl::Status status = ReadProtoFromString(proto_string, &message);
  CHECK(status.ok()) << status;
  return message;
}

}  // namespace p4graphs

#endif  // P4GRAPHS_UTIL_TESTING_H_
