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

#include "src/pbjson/codec/field_converter.h"

#include <cmath>
#include <string>

#include "include/pbjson/codec/errors.h"
#include "src/pbjson/codec/message_encoder.h"

#include "absl/strings/str_format.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::Message;
using ::google::protobuf::Reflection;
using json::JsonObject;

absl::Status FieldConverter::FromJson(const JsonObject& value,
                                      const FieldDescriptor* field,
                                      Message* message) const {
  // enums travel as their symbolic names for readability of the JSON.
  if (field->type() == FieldDescriptor::TYPE_ENUM) {
    if (!value.is_string()) {
      const std::string err_msg = absl::StrFormat(
          "enum field %s expects a symbol name, got JSON %s", field->name(),
          value.type_name());
      return ValueConversionError(err_msg);
    }
    auto status_or_number = enum_resolver_.ResolveName(
        value.get_ref<const std::string&>(), field, message->GetDescriptor());
    if (!status_or_number.ok()) {
      return status_or_number.status();
    }
    return StoreScalar(ScalarValue(static_cast<int32_t>(*status_or_number)),
                       field, message);
  }

  auto status_or_value = CoerceJsonScalar(value, field);
  if (!status_or_value.ok()) {
    return status_or_value.status();
  }
  return StoreScalar(*status_or_value, field, message);
}

absl::StatusOr<JsonObject> FieldConverter::ToJson(const Message& message,
                                                  const FieldDescriptor* field,
                                                  int index, int max_depth) {
  const Reflection* reflection = message.GetReflection();
  const bool repeated = index >= 0;

  switch (field->type()) {
    case FieldDescriptor::TYPE_ENUM: {
      int number = repeated
                       ? reflection->GetRepeatedEnumValue(message, field, index)
                       : reflection->GetEnumValue(message, field);
      auto status_or_name = EnumResolver::ResolveNumber(number, field);
      if (!status_or_name.ok()) {
        return status_or_name.status();
      }
      return JsonObject(*status_or_name);
    }
    case FieldDescriptor::TYPE_MESSAGE: {
      const Message& embedded =
          repeated ? reflection->GetRepeatedMessage(message, field, index)
                   : reflection->GetMessage(message, field);
      return EncodeMessage(embedded, max_depth - 1);
    }
    case FieldDescriptor::TYPE_FLOAT: {
      float f = repeated ? reflection->GetRepeatedFloat(message, field, index)
                         : reflection->GetFloat(message, field);
      // JSON numbers cannot hold these; the names read back through
      // SimpleAtod.
      if (std::isnan(f)) {
        return JsonObject("NaN");
      }
      if (std::isinf(f)) {
        return JsonObject(f > 0 ? "Infinity" : "-Infinity");
      }
      return JsonObject(f);
    }
    default:
      break;
  }

  // values in the coercion table are already native scalars.
  if (!IsCoercibleType(field->type())) {
    return GetUnsupportedFieldTypeError(field);
  }
  switch (field->cpp_type()) {
#define GET_FIELD(CPPTYPE, METHOD)                                       \
  case FieldDescriptor::CPPTYPE_##CPPTYPE:                               \
    return JsonObject(                                                   \
        repeated ? reflection->GetRepeated##METHOD(message, field, index) \
                 : reflection->Get##METHOD(message, field))

    GET_FIELD(INT32, Int32);
    GET_FIELD(INT64, Int64);
    GET_FIELD(UINT32, UInt32);
    GET_FIELD(UINT64, UInt64);
    GET_FIELD(BOOL, Bool);
    GET_FIELD(STRING, String);
#undef GET_FIELD
    default:
      return GetUnsupportedFieldTypeError(field);
  }
}

}  // namespace codec
}  // namespace pbjson
