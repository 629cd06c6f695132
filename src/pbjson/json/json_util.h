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

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "nlohmann/json.hpp"

/**
 * Utilities for working with JSON without exceptions.
 */
namespace pbjson {
namespace json {

// Object keys keep insertion order, so encoded output follows field order.
using JsonObject = ::nlohmann::ordered_json;
using JsonObjectValueType = ::nlohmann::detail::value_t;

enum JsonParserResultDetail {
  EMPTY,
  OK,
  OUT_OF_RANGE,
  TYPE_ERROR,
  INVALID_VALUE,
};

const char* JsonParserResultDetailName(JsonParserResultDetail detail);

// Parse JSON text. Syntax errors are returned as a JsonParseError status
// carrying the parser's own message.
absl::StatusOr<JsonObject> JsonParse(absl::string_view str);

// Serialize. A negative indent produces the compact form. Strings that are not
// valid UTF-8 fail with a ValueConversionError.
absl::StatusOr<std::string> JsonDump(const JsonObject& j, int indent = -1);

template <typename T>
std::pair<absl::optional<T>, JsonParserResultDetail> JsonValueAs(
    const JsonObject&) {
  static_assert(sizeof(T) == 0, "Unsupported Type");
}

// Numbers, with fractions truncated toward zero, and decimal strings. Values
// the target cannot hold report OUT_OF_RANGE.
template <>
std::pair<absl::optional<int64_t>, JsonParserResultDetail> JsonValueAs<int64_t>(
    const JsonObject& j);

template <>
std::pair<absl::optional<uint64_t>, JsonParserResultDetail>
JsonValueAs<uint64_t>(const JsonObject& j);

// Any number, or a string holding one.
template <>
std::pair<absl::optional<double>, JsonParserResultDetail> JsonValueAs<double>(
    const JsonObject& j);

// Booleans, "true"/"false" strings and numbers (non-zero is true).
template <>
std::pair<absl::optional<bool>, JsonParserResultDetail> JsonValueAs<bool>(
    const JsonObject& j);

// Strings as-is; numbers and booleans as their JSON text.
template <>
std::pair<absl::optional<std::string>, JsonParserResultDetail>
JsonValueAs<std::string>(const JsonObject& j);

// Iterate over an object's key set.
// Returns false if not an object, or any of the visitor calls returns false.
bool JsonObjectIterate(const JsonObject& j,
                       const std::function<bool(const std::string& key)>& visitor);

}  // namespace json
}  // namespace pbjson
