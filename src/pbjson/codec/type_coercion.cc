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

#include "src/pbjson/codec/type_coercion.h"

#include <cmath>
#include <limits>

#include "include/pbjson/codec/errors.h"

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_format.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::Message;
using ::google::protobuf::Reflection;
using json::JsonObject;
using json::JsonParserResultDetail;
namespace {

using Coercer = absl::StatusOr<ScalarValue> (*)(const JsonObject&,
                                                const FieldDescriptor*);

absl::Status GetConversionError(const JsonObject& value,
                                const FieldDescriptor* field_descriptor,
                                JsonParserResultDetail detail) {
  const std::string err_msg = absl::StrFormat(
      "unable to convert JSON %s to %s for field %s: %s", value.type_name(),
      field_descriptor->type_name(), field_descriptor->name(),
      json::JsonParserResultDetailName(detail));
  return ValueConversionError(err_msg,
                              detail == JsonParserResultDetail::OUT_OF_RANGE);
}

absl::StatusOr<ScalarValue> CoerceBool(const JsonObject& value,
                                       const FieldDescriptor* field) {
  auto result = json::JsonValueAs<bool>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  return ScalarValue(*result.first);
}

absl::StatusOr<ScalarValue> CoerceFloat(const JsonObject& value,
                                        const FieldDescriptor* field) {
  auto result = json::JsonValueAs<double>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  double d = *result.first;
  if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max()) {
    return GetConversionError(value, field,
                              JsonParserResultDetail::OUT_OF_RANGE);
  }
  return ScalarValue(static_cast<float>(d));
}

// Signed 32-bit targets: int32 fields and enum numbers.
absl::StatusOr<ScalarValue> CoerceInt32(const JsonObject& value,
                                        const FieldDescriptor* field) {
  auto result = json::JsonValueAs<int64_t>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  int64_t i = *result.first;
  if (i < std::numeric_limits<int32_t>::min() ||
      i > std::numeric_limits<int32_t>::max()) {
    return GetConversionError(value, field,
                              JsonParserResultDetail::OUT_OF_RANGE);
  }
  return ScalarValue(static_cast<int32_t>(i));
}

absl::StatusOr<ScalarValue> CoerceInt64(const JsonObject& value,
                                        const FieldDescriptor* field) {
  auto result = json::JsonValueAs<int64_t>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  return ScalarValue(*result.first);
}

absl::StatusOr<ScalarValue> CoerceUInt32(const JsonObject& value,
                                         const FieldDescriptor* field) {
  auto result = json::JsonValueAs<uint64_t>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  if (*result.first > std::numeric_limits<uint32_t>::max()) {
    return GetConversionError(value, field,
                              JsonParserResultDetail::OUT_OF_RANGE);
  }
  return ScalarValue(static_cast<uint32_t>(*result.first));
}

absl::StatusOr<ScalarValue> CoerceUInt64(const JsonObject& value,
                                         const FieldDescriptor* field) {
  auto result = json::JsonValueAs<uint64_t>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  return ScalarValue(*result.first);
}

absl::StatusOr<ScalarValue> CoerceString(const JsonObject& value,
                                         const FieldDescriptor* field) {
  auto result = json::JsonValueAs<std::string>(value);
  if (!result.first.has_value()) {
    return GetConversionError(value, field, result.second);
  }
  return ScalarValue(std::move(*result.first));
}

const absl::flat_hash_map<FieldDescriptor::Type, Coercer>& CoercionTable() {
  static const auto* const coercion_table =
      new absl::flat_hash_map<FieldDescriptor::Type, Coercer>({
          {FieldDescriptor::TYPE_BOOL, &CoerceBool},
          {FieldDescriptor::TYPE_FLOAT, &CoerceFloat},
          {FieldDescriptor::TYPE_INT32, &CoerceInt32},
          {FieldDescriptor::TYPE_INT64, &CoerceInt64},
          {FieldDescriptor::TYPE_UINT32, &CoerceUInt32},
          {FieldDescriptor::TYPE_UINT64, &CoerceUInt64},
          {FieldDescriptor::TYPE_STRING, &CoerceString},
          {FieldDescriptor::TYPE_ENUM, &CoerceInt32},
      });
  return *coercion_table;
}

absl::Status GetStoreError(const FieldDescriptor* field_descriptor) {
  const std::string err_msg =
      absl::StrFormat("unable to store value for field %s of type %s",
                      field_descriptor->name(), field_descriptor->type_name());
  return ValueConversionError(err_msg);
}

}  // namespace

absl::Status GetUnsupportedFieldTypeError(
    const FieldDescriptor* field_descriptor) {
  const std::string err_msg = absl::StrFormat(
      "ProtoType %s of field %s not supported yet",
      field_descriptor->type_name(), field_descriptor->full_name());
  return UnsupportedFieldTypeError(err_msg);
}

bool IsCoercibleType(FieldDescriptor::Type type) {
  return CoercionTable().contains(type);
}

absl::StatusOr<ScalarValue> CoerceJsonScalar(
    const JsonObject& value, const FieldDescriptor* field_descriptor) {
  auto it = CoercionTable().find(field_descriptor->type());
  if (it == CoercionTable().end()) {
    return GetUnsupportedFieldTypeError(field_descriptor);
  }
  return it->second(value, field_descriptor);
}

absl::Status StoreScalar(const ScalarValue& value,
                         const FieldDescriptor* field_descriptor,
                         Message* message) {
  const Reflection* reflection = message->GetReflection();
  switch (field_descriptor->cpp_type()) {
    case FieldDescriptor::CPPTYPE_ENUM: {
      const int32_t* number = absl::get_if<int32_t>(&value);
      if (number == nullptr) {
        return GetStoreError(field_descriptor);
      }
      if (field_descriptor->is_repeated()) {
        reflection->AddEnumValue(message, field_descriptor, *number);
      } else {
        reflection->SetEnumValue(message, field_descriptor, *number);
      }
      break;
    }
#define STORE_FIELD(CPPTYPE, METHOD, LTYPE)                         \
  case FieldDescriptor::CPPTYPE_##CPPTYPE: {                        \
    const LTYPE* LTYPE##_value = absl::get_if<LTYPE>(&value);       \
    if (LTYPE##_value == nullptr) {                                 \
      return GetStoreError(field_descriptor);                       \
    }                                                               \
    if (field_descriptor->is_repeated()) {                          \
      reflection->Add##METHOD(message, field_descriptor,            \
                              *LTYPE##_value);                      \
    } else {                                                        \
      reflection->Set##METHOD(message, field_descriptor,            \
                              *LTYPE##_value);                      \
    }                                                               \
  } break

    STORE_FIELD(INT32, Int32, int32_t);
    STORE_FIELD(INT64, Int64, int64_t);
    STORE_FIELD(UINT32, UInt32, uint32_t);
    STORE_FIELD(UINT64, UInt64, uint64_t);
    STORE_FIELD(FLOAT, Float, float);
    STORE_FIELD(BOOL, Bool, bool);
#undef STORE_FIELD
    case FieldDescriptor::CPPTYPE_STRING: {
      const std::string* str_value = absl::get_if<std::string>(&value);
      if (str_value == nullptr) {
        return GetStoreError(field_descriptor);
      }
      if (field_descriptor->is_repeated()) {
        reflection->AddString(message, field_descriptor, *str_value);
      } else {
        reflection->SetString(message, field_descriptor, *str_value);
      }
      break;
    }
    default:
      return GetUnsupportedFieldTypeError(field_descriptor);
  }
  return absl::OkStatus();
}

}  // namespace codec
}  // namespace pbjson
