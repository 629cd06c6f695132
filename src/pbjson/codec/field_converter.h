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

#ifndef PBJSON_CODEC_FIELD_CONVERTER_H
#define PBJSON_CODEC_FIELD_CONVERTER_H

#include "src/pbjson/codec/enum_resolver.h"
#include "src/pbjson/codec/type_coercion.h"
#include "src/pbjson/json/json_util.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"

namespace pbjson {
namespace codec {

// Converts the value of one field in either direction.
class FieldConverter {
 public:
  explicit FieldConverter(const EnumResolver& enum_resolver)
      : enum_resolver_(enum_resolver) {}

  // Converts a JSON scalar (one array element for repeated fields) and
  // stores it on the field of message. Enum fields take the symbolic name;
  // message fields are not supported in this direction.
  absl::Status FromJson(const json::JsonObject& value,
                        const ::google::protobuf::FieldDescriptor* field,
                        ::google::protobuf::Message* message) const;

  // Converts the current value of field, element index for repeated fields
  // and -1 otherwise. Embedded messages are encoded recursively with
  // max_depth - 1 levels left.
  static absl::StatusOr<json::JsonObject> ToJson(
      const ::google::protobuf::Message& message,
      const ::google::protobuf::FieldDescriptor* field, int index,
      int max_depth);

 private:
  const EnumResolver& enum_resolver_;
};

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_FIELD_CONVERTER_H
