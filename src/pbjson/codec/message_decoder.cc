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

#include "src/pbjson/codec/message_decoder.h"

#include <string>

#include "include/pbjson/codec/errors.h"
#include "src/pbjson/utils/logger.h"

#include "absl/strings/str_format.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::Descriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::Message;
using ::google::protobuf::Reflection;
using json::JsonObject;

absl::Status MessageDecoder::Decode(const JsonObject& json_data,
                                    Message* message) const {
  const Descriptor* descriptor = message->GetDescriptor();
  if (!json_data.is_object()) {
    const std::string err_msg =
        absl::StrFormat("expected a JSON object for message %s, got JSON %s",
                        descriptor->full_name(), json_data.type_name());
    return ValueConversionError(err_msg);
  }

  auto status = checkUnknownFields(json_data, descriptor);
  if (!status.ok()) {
    return status;
  }

  for (int i = 0; i < descriptor->field_count(); ++i) {
    const FieldDescriptor* field = descriptor->field(i);
    auto it = json_data.find(field->name());
    if (it != json_data.end()) {
      status = decodeField(*it, field, message);
      if (!status.ok()) {
        PBJSON_DEBUG("Decoding %s failed: %s", field->full_name().c_str(),
                     status.ToString().c_str());
        return status;
      }
    } else if (field->has_default_value()) {
      // always set the default explicitly, an unset required field with a
      // default is otherwise indistinguishable from a missing one.
      status = SetDefaultValue(field, message);
      if (!status.ok()) {
        return status;
      }
      PBJSON_TRACE("Field %s set to its default", field->full_name().c_str());
    } else if (field->is_required()) {
      const std::string err_msg = absl::StrFormat(
          "Field %s is not set in json data", field->name());
      PBJSON_DEBUG("%s", err_msg.c_str());
      return JsonDataMissingError(err_msg);
    }
  }
  return absl::OkStatus();
}

absl::Status MessageDecoder::checkUnknownFields(
    const JsonObject& json_data, const Descriptor* descriptor) const {
  std::string unknown;
  bool known = json::JsonObjectIterate(json_data, [&](const std::string& key) {
    if (descriptor->FindFieldByName(key) != nullptr) {
      return true;
    }
    if (!options_.ignore_unknown_fields) {
      unknown = key;
      return false;
    }
    PBJSON_DEBUG("Ignoring unknown field %s of %s", key.c_str(),
                 descriptor->full_name().c_str());
    return true;
  });

  if (!known) {
    const std::string err_msg = absl::StrFormat(
        "Field %s is not defined by %s", unknown, descriptor->full_name());
    return ValueConversionError(err_msg);
  }
  return absl::OkStatus();
}

absl::Status MessageDecoder::decodeField(const JsonObject& value,
                                         const FieldDescriptor* field,
                                         Message* message) const {
  if (!field->is_repeated()) {
    return field_converter_.FromJson(value, field, message);
  }

  if (!value.is_array()) {
    const std::string err_msg =
        absl::StrFormat("repeated field %s expects a JSON array, got JSON %s",
                        field->name(), value.type_name());
    return ValueConversionError(err_msg);
  }
  for (const auto& element : value) {
    auto status = field_converter_.FromJson(element, field, message);
    if (!status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

absl::Status SetDefaultValue(const FieldDescriptor* field_descriptor,
                             Message* message) {
  const Reflection* reflection = message->GetReflection();
  switch (field_descriptor->cpp_type()) {
#define SET_DEFAULT(CPPTYPE, METHOD, DEFAULT)                      \
  case FieldDescriptor::CPPTYPE_##CPPTYPE:                         \
    reflection->Set##METHOD(                                       \
        message, field_descriptor,                                 \
        field_descriptor->default_value_##DEFAULT());              \
    break

    SET_DEFAULT(INT32, Int32, int32);
    SET_DEFAULT(INT64, Int64, int64);
    SET_DEFAULT(UINT32, UInt32, uint32);
    SET_DEFAULT(UINT64, UInt64, uint64);
    SET_DEFAULT(DOUBLE, Double, double);
    SET_DEFAULT(FLOAT, Float, float);
    SET_DEFAULT(BOOL, Bool, bool);
    SET_DEFAULT(STRING, String, string);
    SET_DEFAULT(ENUM, Enum, enum);
#undef SET_DEFAULT
    default: {
      const std::string err_msg = absl::StrFormat(
          "Field %s of type %s cannot carry a default",
          field_descriptor->name(), field_descriptor->type_name());
      return UnsupportedFieldTypeError(err_msg);
    }
  }
  return absl::OkStatus();
}

}  // namespace codec
}  // namespace pbjson
