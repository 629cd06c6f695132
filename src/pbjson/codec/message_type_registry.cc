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

#include "include/pbjson/codec/message_type_registry.h"

#include "src/pbjson/utils/logger.h"

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::Descriptor;
using ::google::protobuf::DescriptorPool;
using ::google::protobuf::DynamicMessageFactory;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::FileDescriptor;
using ::google::protobuf::FileDescriptorSet;
using ::google::protobuf::Message;

MessageTypeRegistry::MessageTypeRegistry(
    const FileDescriptorSet& file_descriptor_set)
    : descriptor_pool_(absl::make_unique<DescriptorPool>()) {
  for (const auto& file_descriptor_proto : file_descriptor_set.file()) {
    const FileDescriptor* file_descriptor =
        descriptor_pool_->BuildFile(file_descriptor_proto);
    if (file_descriptor == nullptr) {
      PBJSON_ERROR("Unable to build %s, its types are not registered",
                   file_descriptor_proto.name().c_str());
      continue;
    }

    for (int index = 0; index < file_descriptor->message_type_count();
         index++) {
      indexMessage(file_descriptor->message_type(index));
    }
    for (int index = 0; index < file_descriptor->enum_type_count(); index++) {
      const EnumDescriptor* enum_descriptor = file_descriptor->enum_type(index);
      enum_hash_map_[enum_descriptor->full_name()] = enum_descriptor;
    }
  }
  dynamic_message_factory_ =
      absl::make_unique<DynamicMessageFactory>(descriptor_pool_.get());
  PBJSON_DEBUG("Registered %d message types", message_type_count());
}

void MessageTypeRegistry::indexMessage(const Descriptor* descriptor) {
  message_hash_map_[descriptor->full_name()] = descriptor;
  for (int index = 0; index < descriptor->nested_type_count(); index++) {
    indexMessage(descriptor->nested_type(index));
  }
  for (int index = 0; index < descriptor->enum_type_count(); index++) {
    const EnumDescriptor* enum_descriptor = descriptor->enum_type(index);
    enum_hash_map_[enum_descriptor->full_name()] = enum_descriptor;
  }
}

const Descriptor* MessageTypeRegistry::ResolveMessage(
    absl::string_view name) const {
  auto result = message_hash_map_.find(name);
  if (result != message_hash_map_.end()) {
    return result->second;
  }
  return nullptr;
}

const EnumDescriptor* MessageTypeRegistry::ResolveEnum(
    absl::string_view name) const {
  auto result = enum_hash_map_.find(name);
  if (result != enum_hash_map_.end()) {
    return result->second;
  }
  return nullptr;
}

absl::StatusOr<std::unique_ptr<Message>> MessageTypeRegistry::NewMessage(
    absl::string_view name) const {
  const Descriptor* descriptor = ResolveMessage(name);
  if (descriptor == nullptr) {
    return absl::NotFoundError(
        absl::StrFormat("message type %s is not registered", name));
  }
  const Message* prototype = dynamic_message_factory_->GetPrototype(descriptor);
  if (prototype == nullptr) {
    return absl::InternalError(
        absl::StrFormat("no prototype for message type %s", name));
  }
  return std::unique_ptr<Message>(prototype->New());
}

}  // namespace codec
}  // namespace pbjson
