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

#include "p4graphs/util/status.h"

#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace p4graphs {

absl::Status StatusBuilder::GetStatusAndLog() const {
  std::string message;
  switch (join_style_) {
    case MessageJoinStyle::kPrepend:
      absl::StrAppend(&message, stream_.str(), status_.message());
      break;
    case MessageJoinStyle::kAppend:
      absl::StrAppend(&message, status_.message(), stream_.str());
      break;
    case MessageJoinStyle::kAnnotate:
    default: {
      if (!status_.message().empty() && !stream_.str().empty()) {
        absl::StrAppend(&message, status_.message(), "; ", stream_.str());
      } else if (status_.message().empty()) {
        absl::StrAppend(&message, stream_.str());
      } else {
        absl::StrAppend(&message, status_.message());
      }
      break;
    }
  }
  if (log_error_ && status_.code() != absl::StatusCode::kOk) {
    LOG(ERROR) << message;
  }
  absl::Status new_status(status_.code(), message);
  status_.ForEachPayload(
      [&new_status](absl::string_view url, const absl::Cord& cord) {
        new_status.SetPayload(url, cord);
      });
  return new_status;
}

}  // namespace p4graphs
