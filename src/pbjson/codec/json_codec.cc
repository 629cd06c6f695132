/* Copyright 2019 Istio Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "include/pbjson/codec/json_codec.h"

#include "src/pbjson/codec/message_decoder.h"
#include "src/pbjson/codec/message_encoder.h"
#include "src/pbjson/json/json_util.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::Message;

absl::Status JsonToMessage(absl::string_view json, Message* message,
                           const DecodeOptions& options) {
  auto status_or_tree = json::JsonParse(json);
  if (!status_or_tree.ok()) {
    message->Clear();
    return status_or_tree.status();
  }
  return JsonTreeToMessage(*status_or_tree, message, options);
}

absl::Status JsonTreeToMessage(const JsonTree& tree, Message* message,
                               const DecodeOptions& options) {
  message->Clear();
  MessageDecoder decoder(options);
  auto status = decoder.Decode(tree, message);
  if (!status.ok()) {
    message->Clear();
  }
  return status;
}

absl::StatusOr<std::unique_ptr<Message>> JsonToMessage(
    absl::string_view json, const Message& prototype,
    const DecodeOptions& options) {
  std::unique_ptr<Message> message(prototype.New());
  auto status = JsonToMessage(json, message.get(), options);
  if (!status.ok()) {
    return status;
  }
  return message;
}

absl::StatusOr<std::unique_ptr<Message>> JsonToMessage(
    absl::string_view json, absl::string_view type_name,
    const MessageTypeRegistry& registry, const DecodeOptions& options) {
  auto status_or_message = registry.NewMessage(type_name);
  if (!status_or_message.ok()) {
    return status_or_message.status();
  }
  std::unique_ptr<Message> message = std::move(*status_or_message);
  auto status = JsonToMessage(json, message.get(), options);
  if (!status.ok()) {
    return status;
  }
  return message;
}

absl::StatusOr<std::string> MessageToJson(const Message& message,
                                          const EncodeOptions& options) {
  auto status_or_tree = EncodeMessage(message, options.max_depth);
  if (!status_or_tree.ok()) {
    return status_or_tree.status();
  }
  return json::JsonDump(*status_or_tree, options.indent);
}

absl::StatusOr<JsonTree> MessageToJsonTree(const Message& message,
                                           const EncodeOptions& options) {
  return EncodeMessage(message, options.max_depth);
}

}  // namespace codec
}  // namespace pbjson
