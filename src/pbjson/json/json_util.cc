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

#include "src/pbjson/json/json_util.h"

#include <cmath>
#include <limits>

#include "absl/strings/numbers.h"
#include "include/pbjson/codec/errors.h"

namespace pbjson {
namespace json {
namespace {

// 2^63 and 2^64; doubles at or above these do not fit the integer types.
constexpr double kTwoPow63 = 9223372036854775808.0;
constexpr double kTwoPow64 = 18446744073709551616.0;

// Fractions are dropped toward zero, as a C cast does.
bool Truncate(double* d) {
  if (!std::isfinite(*d)) {
    return false;
  }
  *d = std::trunc(*d);
  return true;
}

}  // namespace

const char* JsonParserResultDetailName(JsonParserResultDetail detail) {
  switch (detail) {
    case EMPTY:
      return "empty";
    case OK:
      return "ok";
    case OUT_OF_RANGE:
      return "out of range";
    case TYPE_ERROR:
      return "type error";
    case INVALID_VALUE:
      return "invalid value";
  }
  return "unknown";
}

absl::StatusOr<JsonObject> JsonParse(absl::string_view str) {
  try {
    return JsonObject::parse(str.data(), str.data() + str.size());
  } catch (const JsonObject::parse_error& e) {
    return codec::JsonParseError(e.what());
  }
}

absl::StatusOr<std::string> JsonDump(const JsonObject& j, int indent) {
  try {
    return j.dump(indent);
  } catch (const JsonObject::type_error& e) {
    return codec::ValueConversionError(e.what());
  }
}

template <>
std::pair<absl::optional<int64_t>, JsonParserResultDetail> JsonValueAs<int64_t>(
    const JsonObject& j) {
  if (j.is_number_unsigned()) {
    uint64_t value = j.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::make_pair(absl::nullopt, JsonParserResultDetail::OUT_OF_RANGE);
    }
    return std::make_pair(static_cast<int64_t>(value),
                          JsonParserResultDetail::OK);
  } else if (j.is_number_integer()) {
    return std::make_pair(j.get<int64_t>(), JsonParserResultDetail::OK);
  } else if (j.is_number_float()) {
    double value = j.get<double>();
    if (!Truncate(&value)) {
      return std::make_pair(absl::nullopt,
                            JsonParserResultDetail::INVALID_VALUE);
    }
    if (value >= kTwoPow63 || value < -kTwoPow63) {
      return std::make_pair(absl::nullopt, JsonParserResultDetail::OUT_OF_RANGE);
    }
    return std::make_pair(static_cast<int64_t>(value),
                          JsonParserResultDetail::OK);
  } else if (j.is_string()) {
    int64_t result = 0;
    if (absl::SimpleAtoi(j.get_ref<std::string const&>(), &result)) {
      return std::make_pair(result, JsonParserResultDetail::OK);
    } else {
      return std::make_pair(absl::nullopt,
                            JsonParserResultDetail::INVALID_VALUE);
    }
  }
  return std::make_pair(absl::nullopt, JsonParserResultDetail::TYPE_ERROR);
}

template <>
std::pair<absl::optional<uint64_t>, JsonParserResultDetail>
JsonValueAs<uint64_t>(const JsonObject& j) {
  if (j.is_number_unsigned()) {
    return std::make_pair(j.get<uint64_t>(), JsonParserResultDetail::OK);
  } else if (j.is_number_integer()) {
    int64_t value = j.get<int64_t>();
    if (value < 0) {
      return std::make_pair(absl::nullopt, JsonParserResultDetail::OUT_OF_RANGE);
    }
    return std::make_pair(static_cast<uint64_t>(value),
                          JsonParserResultDetail::OK);
  } else if (j.is_number_float()) {
    double value = j.get<double>();
    if (!Truncate(&value)) {
      return std::make_pair(absl::nullopt,
                            JsonParserResultDetail::INVALID_VALUE);
    }
    if (value >= kTwoPow64 || value < 0) {
      return std::make_pair(absl::nullopt, JsonParserResultDetail::OUT_OF_RANGE);
    }
    return std::make_pair(static_cast<uint64_t>(value),
                          JsonParserResultDetail::OK);
  } else if (j.is_string()) {
    uint64_t result = 0;
    if (absl::SimpleAtoi(j.get_ref<std::string const&>(), &result)) {
      return std::make_pair(result, JsonParserResultDetail::OK);
    } else {
      return std::make_pair(absl::nullopt,
                            JsonParserResultDetail::INVALID_VALUE);
    }
  }
  return std::make_pair(absl::nullopt, JsonParserResultDetail::TYPE_ERROR);
}

template <>
std::pair<absl::optional<double>, JsonParserResultDetail> JsonValueAs<double>(
    const JsonObject& j) {
  if (j.is_number()) {
    return std::make_pair(j.get<double>(), JsonParserResultDetail::OK);
  } else if (j.is_string()) {
    double result = 0;
    if (absl::SimpleAtod(j.get_ref<std::string const&>(), &result)) {
      return std::make_pair(result, JsonParserResultDetail::OK);
    } else {
      return std::make_pair(absl::nullopt,
                            JsonParserResultDetail::INVALID_VALUE);
    }
  }
  return std::make_pair(absl::nullopt, JsonParserResultDetail::TYPE_ERROR);
}

template <>
std::pair<absl::optional<bool>, JsonParserResultDetail> JsonValueAs<bool>(
    const JsonObject& j) {
  if (j.is_boolean()) {
    return std::make_pair(j.get<bool>(), JsonParserResultDetail::OK);
  }
  if (j.is_number_integer()) {
    return std::make_pair(j.get<int64_t>() != 0, JsonParserResultDetail::OK);
  }
  if (j.is_number_float()) {
    return std::make_pair(j.get<double>() != 0, JsonParserResultDetail::OK);
  }
  if (j.is_string()) {
    const std::string& v = j.get_ref<std::string const&>();
    if (v == "true") {
      return std::make_pair(true, JsonParserResultDetail::OK);
    } else if (v == "false") {
      return std::make_pair(false, JsonParserResultDetail::OK);
    } else {
      return std::make_pair(absl::nullopt,
                            JsonParserResultDetail::INVALID_VALUE);
    }
  }
  return std::make_pair(absl::nullopt, JsonParserResultDetail::TYPE_ERROR);
}

template <>
std::pair<absl::optional<std::string>, JsonParserResultDetail>
JsonValueAs<std::string>(const JsonObject& j) {
  if (j.is_string()) {
    return std::make_pair(j.get_ref<std::string const&>(),
                          JsonParserResultDetail::OK);
  }
  if (j.is_number() || j.is_boolean()) {
    return std::make_pair(j.dump(), JsonParserResultDetail::OK);
  }
  return std::make_pair(absl::nullopt, JsonParserResultDetail::TYPE_ERROR);
}

bool JsonObjectIterate(
    const JsonObject& j,
    const std::function<bool(const std::string& key)>& visitor) {
  if (!j.is_object()) {
    return false;
  }
  for (const auto& elt : j.items()) {
    if (!visitor(elt.key())) {
      return false;
    }
  }
  return true;
}

}  // namespace json
}  // namespace pbjson
