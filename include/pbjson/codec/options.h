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

#ifndef PBJSON_CODEC_OPTIONS_H
#define PBJSON_CODEC_OPTIONS_H

namespace pbjson {
namespace codec {

// Where an enum symbol from JSON is looked up.
enum class EnumScope {
  // Among the enums declared inside the message type being decoded. Enum
  // fields whose type is declared elsewhere cannot be decoded by name.
  kMessageType,
  // In the field's own enum type.
  kFieldEnumType,
};

struct DecodeOptions {
  // When false, a JSON key that names no field of the message type fails the
  // decode with a ValueConversionError.
  bool ignore_unknown_fields = true;
  EnumScope enum_scope = EnumScope::kMessageType;
};

// Nesting depth at which encoding gives up. Recursive message types never
// bottom out, since unset embedded messages are encoded as their defaults.
constexpr int kDefaultMaxEncodeDepth = 64;

struct EncodeOptions {
  // Negative for compact output, otherwise the pretty-print indent width.
  int indent = -1;
  // Levels of embedded messages, the top-level message included.
  int max_depth = kDefaultMaxEncodeDepth;
};

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_OPTIONS_H
