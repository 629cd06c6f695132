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

#ifndef PBJSON_CODEC_JSON_CODEC_H
#define PBJSON_CODEC_JSON_CODEC_H

#include <memory>
#include <string>

#include "include/pbjson/codec/errors.h"
#include "include/pbjson/codec/message_type_registry.h"
#include "include/pbjson/codec/options.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "nlohmann/json.hpp"

/**
 * Conversion between protobuf messages and JSON objects keyed by field name.
 *
 * Decoding fills every field with a declared default even when its key is
 * absent, and fails when a required field has neither a key nor a default.
 * Enum fields are written as their symbolic names. Embedded message fields
 * are encoded recursively but cannot be decoded. Encoding emits every field
 * of the message type, in declaration order. Recursive message types cannot
 * be encoded: an unset embedded message still contributes its defaults, so
 * the nesting only ends at EncodeOptions::max_depth, with an error.
 *
 * Errors are reported as statuses; see errors.h for the kinds.
 */
namespace pbjson {
namespace codec {

using JsonTree = ::nlohmann::ordered_json;

// Replaces the content of message with the fields decoded from json. On
// error message is left cleared.
absl::Status JsonToMessage(absl::string_view json,
                           ::google::protobuf::Message* message,
                           const DecodeOptions& options = DecodeOptions());

// Same as above, starting from an already parsed tree.
absl::Status JsonTreeToMessage(const JsonTree& tree,
                               ::google::protobuf::Message* message,
                               const DecodeOptions& options = DecodeOptions());

// Decodes into a new instance of the prototype's type.
absl::StatusOr<std::unique_ptr<::google::protobuf::Message>> JsonToMessage(
    absl::string_view json, const ::google::protobuf::Message& prototype,
    const DecodeOptions& options = DecodeOptions());

// Decodes into a new dynamic instance of the type registered under
// type_name. Fails with NOT_FOUND when the registry does not know the type.
absl::StatusOr<std::unique_ptr<::google::protobuf::Message>> JsonToMessage(
    absl::string_view json, absl::string_view type_name,
    const MessageTypeRegistry& registry,
    const DecodeOptions& options = DecodeOptions());

template <typename MessageType>
absl::StatusOr<MessageType> JsonToMessage(
    absl::string_view json, const DecodeOptions& options = DecodeOptions()) {
  MessageType message;
  auto status = JsonToMessage(json, &message, options);
  if (!status.ok()) {
    return status;
  }
  return message;
}

absl::StatusOr<std::string> MessageToJson(
    const ::google::protobuf::Message& message,
    const EncodeOptions& options = EncodeOptions());

// Same as MessageToJson, without rendering. options.indent is not used.
absl::StatusOr<JsonTree> MessageToJsonTree(
    const ::google::protobuf::Message& message,
    const EncodeOptions& options = EncodeOptions());

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_JSON_CODEC_H
