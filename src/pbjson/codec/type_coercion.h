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

#ifndef PBJSON_CODEC_TYPE_COERCION_H
#define PBJSON_CODEC_TYPE_COERCION_H

#include <cstdint>
#include <string>

#include "src/pbjson/json/json_util.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/variant.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"

namespace pbjson {
namespace codec {

// A JSON scalar cast to a field's representation type. Enum fields hold the
// resolved number as int32_t.
using ScalarValue = absl::variant<bool, float, int32_t, int64_t, uint32_t,
                                  uint64_t, std::string>;

// True for bool, float, int32, int64, uint32, uint64, string and enum. All
// other field types, message included, are outside the table.
bool IsCoercibleType(::google::protobuf::FieldDescriptor::Type type);

// Casts a JSON scalar to the representation of field's type. Fails with
// UnsupportedFieldType when the type is not in the table and with a
// ValueConversionError when the value does not fit.
absl::StatusOr<ScalarValue> CoerceJsonScalar(
    const json::JsonObject& value,
    const ::google::protobuf::FieldDescriptor* field_descriptor);

// Writes value onto the field, appending when the field is repeated.
absl::Status StoreScalar(
    const ScalarValue& value,
    const ::google::protobuf::FieldDescriptor* field_descriptor,
    ::google::protobuf::Message* message);

absl::Status GetUnsupportedFieldTypeError(
    const ::google::protobuf::FieldDescriptor* field_descriptor);

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_TYPE_COERCION_H
