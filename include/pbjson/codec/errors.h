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

#ifndef PBJSON_CODEC_ERRORS_H
#define PBJSON_CODEC_ERRORS_H

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace pbjson {
namespace codec {

// Every failure returned by the codec carries one of these kinds. The kind is
// attached to the status as a payload under kErrorKindTypeUrl, so callers can
// branch on it without parsing messages.
//
//   kJsonParse            INVALID_ARGUMENT    text rejected by the JSON parser
//   kJsonDataMissing      FAILED_PRECONDITION required field absent, no default
//   kUnsupportedFieldType UNIMPLEMENTED       field type cannot be converted
//   kEnumValueNotFound    NOT_FOUND           enum symbol or number unknown
//   kValueConversion      INVALID_ARGUMENT or OUT_OF_RANGE
//                                             value does not fit the field
enum class ErrorKind {
  kOk,
  kJsonParse,
  kJsonDataMissing,
  kUnsupportedFieldType,
  kEnumValueNotFound,
  kValueConversion,
  // A status not produced by the codec.
  kUnknown,
};

extern const char kErrorKindTypeUrl[];

absl::string_view ErrorKindName(ErrorKind kind);

ErrorKind GetErrorKind(const absl::Status& status);

absl::Status JsonParseError(absl::string_view message);
absl::Status JsonDataMissingError(absl::string_view message);
absl::Status UnsupportedFieldTypeError(absl::string_view message);
absl::Status EnumValueNotFoundError(absl::string_view message);
// out_of_range selects OUT_OF_RANGE over INVALID_ARGUMENT.
absl::Status ValueConversionError(absl::string_view message,
                                  bool out_of_range = false);

inline bool IsJsonParseError(const absl::Status& status) {
  return GetErrorKind(status) == ErrorKind::kJsonParse;
}
inline bool IsJsonDataMissing(const absl::Status& status) {
  return GetErrorKind(status) == ErrorKind::kJsonDataMissing;
}
inline bool IsUnsupportedFieldType(const absl::Status& status) {
  return GetErrorKind(status) == ErrorKind::kUnsupportedFieldType;
}
inline bool IsEnumValueNotFound(const absl::Status& status) {
  return GetErrorKind(status) == ErrorKind::kEnumValueNotFound;
}
inline bool IsValueConversionError(const absl::Status& status) {
  return GetErrorKind(status) == ErrorKind::kValueConversion;
}

}  // namespace codec
}  // namespace pbjson

#endif  // PBJSON_CODEC_ERRORS_H
