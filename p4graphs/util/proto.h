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

#ifndef P4GRAPHS_UTIL_PROTO_H_
#define P4GRAPHS_UTIL_PROTO_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace p4graphs {

// Parses the text-format proto in `filename` into `message`.
absl::Status ReadProtoFromFile(absl::string_view filename,
                               google::protobuf::Message *message);

// Parses the text-format `proto_string` into `message`. Parse errors are
// listed line by line in the returned status.
absl::Status ReadProtoFromString(absl::string_view proto_string,
                                 google::protobuf::Message *message);

template <class T>
absl::StatusOr<T> ParseTextProto(absl::string_view proto_string) {
  T message;
  if (auto status = ReadProtoFromString(proto_string, &message); status.ok()) {
    return message;
  } else {
    return status;
  }
}

// Print proto in TextFormat with single line mode enabled.
std::string PrintShortTextProto(const google::protobuf::Message &message);

}  // namespace p4graphs

#endif  // P4GRAPHS_UTIL_PROTO_H_
