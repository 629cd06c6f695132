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

#include "src/pbjson/utils/logger.h"

#include <stdarg.h>
#include <stdio.h>

namespace pbjson {
namespace utils {

Logger::~Logger() {}

void Logger::log(Level level, const char *format, ...) {
  if (!isLoggable(level)) {
    return;
  }

  va_list args;
  va_start(args, format);
  char buffer[512];
  ::vsnprintf(buffer, sizeof(buffer), format, args);
  buffer[sizeof(buffer) - 1] = 0;
  va_end(args);

  writeBuffer(level, buffer);
}

const char *levelString(Logger::Level level) {
  switch (level) {
    case Logger::Level::TRACE_:
      return "TRACE";
    case Logger::Level::DEBUG_:
      return "DEBUG";
    case Logger::Level::INFO_:
      return "INFO";
    case Logger::Level::WARN_:
      return "WARN";
    case Logger::Level::ERROR_:
      return "ERROR";
  }
  return "UNKNOWN";
}

bool StderrLogger::isLoggable(Level level) {
  return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void StderrLogger::writeBuffer(Level level, const char *buffer) {
  fprintf(stderr, "pbjson %s %s\n", levelString(level), buffer);
}

static std::unique_ptr<Logger> active_logger{
    new StderrLogger(Logger::Level::INFO_)};

void setLogger(std::unique_ptr<Logger> logger) {
  if (logger == nullptr) {
    logger.reset(new StderrLogger(Logger::Level::INFO_));
  }
  active_logger = std::move(logger);
  PBJSON_DEBUG("Logger active");
}

Logger &getLogger() { return *active_logger; }

}  // namespace utils
}  // namespace pbjson
