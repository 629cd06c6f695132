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

#ifndef PBJSON_CODEC_ENUM_RESOLVER_H
#define PBJSON_CODEC_ENUM_RESOLVER_H

#include <string>

#include "include/pbjson/codec/options.h"

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/descriptor.h"

namespace pbjson {
namespace codec {

// Translates between enum numbers and their symbolic names.
class EnumResolver {
 public:
  explicit EnumResolver(EnumScope scope) : scope_(scope) {}

  // Resolves a symbolic name read from JSON to the number stored on
  // field_descriptor. With EnumScope::kMessageType the name is looked up
  // among the enums nested in message_type, and the number it resolves to
  // must also be defined by the field's own enum type.
  absl::StatusOr<int> ResolveName(
      absl::string_view name,
      const ::google::protobuf::FieldDescriptor* field_descriptor,
      const ::google::protobuf::Descriptor* message_type) const;

  // Resolves a stored number to its symbolic name in the field's enum type.
  static absl::StatusOr<std::string> ResolveNumber(
      int number, const ::google::protobuf::FieldDescriptor* field_descriptor);

 private:
  EnumScope scope_;
};

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_ENUM_RESOLVER_H
