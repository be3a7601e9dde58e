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

#include "p4graphs/util/proto.h"

#include <fcntl.h>

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "p4graphs/util/status.h"

namespace p4graphs {

namespace {

// Collects errors by appending them to a given string.
class StringErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  // String error_text is unowned and must remain valid during the use of
  // StringErrorCollector.
  explicit StringErrorCollector(std::string *error_text)
      : error_text_{error_text} {};
  StringErrorCollector(const StringErrorCollector &) = delete;
  StringErrorCollector &operator=(const StringErrorCollector &) = delete;

  void AddError(int line, int column, const std::string &message) override {
    if (error_text_ != nullptr) {
      absl::SubstituteAndAppend(error_text_, "$0($1): $2\n", line, column,
                                message);
    }
  }

  void AddWarning(int line, int column, const std::string &message) override {
    AddError(line, column, message);
  }

 private:
  std::string *const error_text_;
};

}  // namespace

absl::Status ReadProtoFromFile(absl::string_view filename,
                               google::protobuf::Message *message) {
  // Verifies that the version of the library that we linked against is
  // compatible with the version of the headers we compiled against.
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  int fd = open(std::string(filename).c_str(), O_RDONLY);
  if (fd < 0) {
    return InvalidArgumentErrorBuilder()
           << "Error opening the file " << filename;
  }

  google::protobuf::io::FileInputStream file_stream(fd);
  file_stream.SetCloseOnDelete(true);

  google::protobuf::TextFormat::Parser parser;
  std::string all_errors;
  StringErrorCollector collector(&all_errors);
  parser.RecordErrorsTo(&collector);

  if (!parser.Parse(&file_stream, message)) {
    return InvalidArgumentErrorBuilder()
           << "Failed to parse file " << filename << " as a "
           << message->GetTypeName() << ":\n"
           << all_errors;
  }

  return absl::OkStatus();
}

absl::Status ReadProtoFromString(absl::string_view proto_string,
                                 google::protobuf::Message *message) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  google::protobuf::TextFormat::Parser parser;
  std::string all_errors;
  StringErrorCollector collector(&all_errors);
  parser.RecordErrorsTo(&collector);

  if (!parser.ParseFromString(std::string(proto_string), message)) {
    return InvalidArgumentErrorBuilder()
           << "string <" << proto_string << "> did not parse as a "
           << message->GetTypeName() << ":\n"
           << all_errors;
  }

  return absl::OkStatus();
}

std::string PrintShortTextProto(const google::protobuf::Message &message) {
  std::string message_short_text;

  google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);

  printer.PrintToString(message, &message_short_text);
  // Single line mode currently might have an extra space at the end.
  if (!message_short_text.empty() && message_short_text.back() == ' ') {
    message_short_text.pop_back();
  }

  return message_short_text;
}

}  // namespace p4graphs
