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

#include "include/pbjson/codec/errors.h"

#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace pbjson {
namespace codec {

const char kErrorKindTypeUrl[] = "type.googleapis.com/pbjson.codec.ErrorKind";

namespace {

constexpr ErrorKind kTaggedKinds[] = {
    ErrorKind::kJsonParse,          ErrorKind::kJsonDataMissing,
    ErrorKind::kUnsupportedFieldType, ErrorKind::kEnumValueNotFound,
    ErrorKind::kValueConversion,
};

absl::Status Tagged(absl::StatusCode code, absl::string_view message,
                    ErrorKind kind) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindTypeUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

}  // namespace

absl::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOk:
      return "Ok";
    case ErrorKind::kJsonParse:
      return "JsonParseError";
    case ErrorKind::kJsonDataMissing:
      return "JsonDataMissingError";
    case ErrorKind::kUnsupportedFieldType:
      return "UnsupportedFieldType";
    case ErrorKind::kEnumValueNotFound:
      return "ProtoEnumValueNotFound";
    case ErrorKind::kValueConversion:
      return "ValueConversionError";
    case ErrorKind::kUnknown:
      break;
  }
  return "Unknown";
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kOk;
  }
  absl::optional<absl::Cord> payload = status.GetPayload(kErrorKindTypeUrl);
  if (!payload.has_value()) {
    return ErrorKind::kUnknown;
  }
  for (ErrorKind kind : kTaggedKinds) {
    if (*payload == ErrorKindName(kind)) {
      return kind;
    }
  }
  return ErrorKind::kUnknown;
}

absl::Status JsonParseError(absl::string_view message) {
  return Tagged(absl::StatusCode::kInvalidArgument, message,
                ErrorKind::kJsonParse);
}

absl::Status JsonDataMissingError(absl::string_view message) {
  return Tagged(absl::StatusCode::kFailedPrecondition, message,
                ErrorKind::kJsonDataMissing);
}

absl::Status UnsupportedFieldTypeError(absl::string_view message) {
  return Tagged(absl::StatusCode::kUnimplemented, message,
                ErrorKind::kUnsupportedFieldType);
}

absl::Status EnumValueNotFoundError(absl::string_view message) {
  return Tagged(absl::StatusCode::kNotFound, message,
                ErrorKind::kEnumValueNotFound);
}

absl::Status ValueConversionError(absl::string_view message,
                                  bool out_of_range) {
  return Tagged(out_of_range ? absl::StatusCode::kOutOfRange
                             : absl::StatusCode::kInvalidArgument,
                message, ErrorKind::kValueConversion);
}

}  // namespace codec
}  // namespace pbjson
