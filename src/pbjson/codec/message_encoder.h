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

#ifndef PBJSON_CODEC_MESSAGE_ENCODER_H
#define PBJSON_CODEC_MESSAGE_ENCODER_H

#include "include/pbjson/codec/options.h"
#include "src/pbjson/json/json_util.h"

#include "absl/status/statusor.h"
#include "google/protobuf/message.h"

namespace pbjson {
namespace codec {

// Builds a JSON object holding every field of message, keyed by field name in
// declaration order. Unset fields contribute their defaults, so no field is
// ever omitted. Fails with an OUT_OF_RANGE ValueConversionError when
// embedded messages nest deeper than max_depth.
absl::StatusOr<json::JsonObject> EncodeMessage(
    const ::google::protobuf::Message& message,
    int max_depth = kDefaultMaxEncodeDepth);

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_MESSAGE_ENCODER_H
