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

#include "src/pbjson/codec/enum_resolver.h"

#include "include/pbjson/codec/errors.h"
#include "src/pbjson/utils/logger.h"

#include "absl/strings/str_format.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::Descriptor;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::EnumValueDescriptor;
using ::google::protobuf::FieldDescriptor;

absl::StatusOr<int> EnumResolver::ResolveName(
    absl::string_view name, const FieldDescriptor* field_descriptor,
    const Descriptor* message_type) const {
  const EnumDescriptor* enum_descriptor = field_descriptor->enum_type();
  if (enum_descriptor == nullptr) {
    const std::string err_msg =
        absl::StrFormat("Could not find enum descriptor for field %s",
                        field_descriptor->name());
    return EnumValueNotFoundError(err_msg);
  }

  const std::string symbol(name);
  const EnumValueDescriptor* enum_value = nullptr;
  if (scope_ == EnumScope::kMessageType) {
    enum_value = message_type->FindEnumValueByName(symbol);
  } else {
    enum_value = enum_descriptor->FindValueByName(symbol);
  }
  if (enum_value == nullptr) {
    const std::string err_msg = absl::StrFormat(
        "Enum does not have a value %s (field %s of %s)", symbol,
        field_descriptor->name(), message_type->full_name());
    return EnumValueNotFoundError(err_msg);
  }

  if (enum_value->type() != enum_descriptor &&
      enum_descriptor->FindValueByNumber(enum_value->number()) == nullptr) {
    // The symbol belongs to another enum of the message type, and its number
    // means nothing to this field.
    const std::string err_msg = absl::StrFormat(
        "Enum %s does not have a value %d (resolved from %s)",
        enum_descriptor->full_name(), enum_value->number(), symbol);
    return EnumValueNotFoundError(err_msg);
  }
  if (enum_value->type() != enum_descriptor) {
    PBJSON_DEBUG("Enum symbol %s of %s stored as %d on field %s",
                 symbol.c_str(), enum_value->type()->full_name().c_str(),
                 enum_value->number(), field_descriptor->name().c_str());
  }
  return enum_value->number();
}

absl::StatusOr<std::string> EnumResolver::ResolveNumber(
    int number, const FieldDescriptor* field_descriptor) {
  const EnumDescriptor* enum_descriptor = field_descriptor->enum_type();
  if (enum_descriptor == nullptr) {
    const std::string err_msg =
        absl::StrFormat("Could not find enum descriptor for field %s",
                        field_descriptor->name());
    return EnumValueNotFoundError(err_msg);
  }
  const EnumValueDescriptor* enum_value =
      enum_descriptor->FindValueByNumber(number);
  if (enum_value == nullptr) {
    const std::string err_msg =
        absl::StrFormat("Enum %s does not have a value %d (field %s)",
                        enum_descriptor->full_name(), number,
                        field_descriptor->name());
    return EnumValueNotFoundError(err_msg);
  }
  return enum_value->name();
}

}  // namespace codec
}  // namespace pbjson
