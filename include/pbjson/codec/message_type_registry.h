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

#ifndef PBJSON_CODEC_MESSAGE_TYPE_REGISTRY_H
#define PBJSON_CODEC_MESSAGE_TYPE_REGISTRY_H

#include <memory>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"
#include "google/protobuf/dynamic_message.h"
#include "google/protobuf/message.h"

namespace pbjson {
namespace codec {

// Message types loaded at runtime from a FileDescriptorSet, for callers that
// have no generated classes. Read-only once constructed. Descriptors and
// messages obtained from a registry are only valid while it is alive.
class MessageTypeRegistry {
 public:
  // Builds every file of the set into a private descriptor pool. Files must
  // appear after the files they import; a file that fails to build is
  // skipped and logged.
  explicit MessageTypeRegistry(
      const ::google::protobuf::FileDescriptorSet& file_descriptor_set);
  virtual ~MessageTypeRegistry() {}

  // Looks up a message type, top-level or nested, by full name. Returns
  // nullptr when unknown.
  const ::google::protobuf::Descriptor* ResolveMessage(
      absl::string_view name) const;
  const ::google::protobuf::EnumDescriptor* ResolveEnum(
      absl::string_view name) const;

  // Creates an empty dynamic instance of the named type. Fails with
  // NOT_FOUND when the type is unknown. The instance refers to descriptors
  // and a prototype owned by this registry, and must be destroyed before it.
  absl::StatusOr<std::unique_ptr<::google::protobuf::Message>> NewMessage(
      absl::string_view name) const;

  int message_type_count() const {
    return static_cast<int>(message_hash_map_.size());
  }

 private:
  void indexMessage(const ::google::protobuf::Descriptor* descriptor);

  std::unique_ptr<::google::protobuf::DescriptorPool> descriptor_pool_;
  // GetPrototype caches prototypes internally, hence mutable.
  mutable std::unique_ptr<::google::protobuf::DynamicMessageFactory>
      dynamic_message_factory_;
  absl::flat_hash_map<std::string, const ::google::protobuf::Descriptor*>
      message_hash_map_;
  absl::flat_hash_map<std::string, const ::google::protobuf::EnumDescriptor*>
      enum_hash_map_;
};

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_MESSAGE_TYPE_REGISTRY_H
