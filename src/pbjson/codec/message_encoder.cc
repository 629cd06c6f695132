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

#include "src/pbjson/codec/message_encoder.h"

#include <string>

#include "include/pbjson/codec/errors.h"
#include "src/pbjson/codec/field_converter.h"
#include "src/pbjson/utils/logger.h"

#include "absl/strings/str_format.h"
#include "google/protobuf/descriptor.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::Descriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::Message;
using ::google::protobuf::Reflection;
using json::JsonObject;

absl::StatusOr<JsonObject> EncodeMessage(const Message& message,
                                         int max_depth) {
  const Descriptor* descriptor = message.GetDescriptor();
  const Reflection* reflection = message.GetReflection();
  if (max_depth < 1) {
    const std::string err_msg = absl::StrFormat(
        "message %s is nested too deeply, encode depth limit reached",
        descriptor->full_name());
    PBJSON_DEBUG("%s", err_msg.c_str());
    return ValueConversionError(err_msg, true);
  }
  JsonObject json_data = JsonObject::object();

  for (int i = 0; i < descriptor->field_count(); ++i) {
    const FieldDescriptor* field = descriptor->field(i);
    if (field->is_repeated()) {
      JsonObject elements = JsonObject::array();
      const int size = reflection->FieldSize(message, field);
      for (int index = 0; index < size; ++index) {
        auto status_or_value = FieldConverter::ToJson(message, field, index,
                                                      max_depth);
        if (!status_or_value.ok()) {
          PBJSON_DEBUG("Encoding %s[%d] failed: %s",
                       field->full_name().c_str(), index,
                       status_or_value.status().ToString().c_str());
          return status_or_value.status();
        }
        elements.push_back(std::move(*status_or_value));
      }
      json_data[field->name()] = std::move(elements);
    } else {
      auto status_or_value =
          FieldConverter::ToJson(message, field, -1, max_depth);
      if (!status_or_value.ok()) {
        PBJSON_DEBUG("Encoding %s failed: %s", field->full_name().c_str(),
                     status_or_value.status().ToString().c_str());
        return status_or_value.status();
      }
      json_data[field->name()] = std::move(*status_or_value);
    }
  }
  return json_data;
}

}  // namespace codec
}  // namespace pbjson
