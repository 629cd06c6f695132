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

#ifndef PBJSON_CODEC_MESSAGE_DECODER_H
#define PBJSON_CODEC_MESSAGE_DECODER_H

#include "include/pbjson/codec/options.h"
#include "src/pbjson/codec/enum_resolver.h"
#include "src/pbjson/codec/field_converter.h"
#include "src/pbjson/json/json_util.h"

#include "absl/status/status.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"

namespace pbjson {
namespace codec {

// Fills a message from a JSON object, one field descriptor at a time.
//
// For every field of the message type, in declaration order:
//  - a key with the field's name is converted and stored (each element of a
//    JSON array is appended, in order, for repeated fields);
//  - otherwise a field with a default gets that default assigned explicitly,
//    so decoded instances do not depend on which optional keys a producer
//    chose to send;
//  - otherwise a required field fails the decode with JsonDataMissingError.
// Keys naming no field are skipped unless ignore_unknown_fields is false.
class MessageDecoder {
 public:
  explicit MessageDecoder(const DecodeOptions& options)
      : options_(options),
        enum_resolver_(options.enum_scope),
        field_converter_(enum_resolver_) {}
  MessageDecoder(const MessageDecoder&) = delete;
  MessageDecoder& operator=(const MessageDecoder&) = delete;

  // message is expected to be empty. On error it may hold a partial result;
  // callers discard it.
  absl::Status Decode(const json::JsonObject& json_data,
                      ::google::protobuf::Message* message) const;

 private:
  absl::Status checkUnknownFields(
      const json::JsonObject& json_data,
      const ::google::protobuf::Descriptor* descriptor) const;

  absl::Status decodeField(const json::JsonObject& value,
                           const ::google::protobuf::FieldDescriptor* field,
                           ::google::protobuf::Message* message) const;

  DecodeOptions options_;
  EnumResolver enum_resolver_;
  FieldConverter field_converter_;
};

// Assigns the declared default of field_descriptor to the field.
absl::Status SetDefaultValue(
    const ::google::protobuf::FieldDescriptor* field_descriptor,
    ::google::protobuf::Message* message);

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_MESSAGE_DECODER_H
