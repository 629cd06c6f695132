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

#include <memory>

namespace pbjson {
namespace utils {

class Logger {
 public:
  virtual ~Logger();

  enum class Level { TRACE_, DEBUG_, INFO_, WARN_, ERROR_ };

  void log(Level level, const char *format, ...)
      __attribute__((format(printf, 3, 4)));

  virtual bool isLoggable(Level level) = 0;

 protected:
  virtual void writeBuffer(Level level, const char *buffer) = 0;
};

// Writes every message at or above min_level to stderr. The process-wide
// logger starts out as a StderrLogger with INFO_ threshold.
class StderrLogger : public Logger {
 public:
  explicit StderrLogger(Level min_level) : min_level_(min_level) {}

  bool isLoggable(Level level) override;

 protected:
  void writeBuffer(Level level, const char *buffer) override;

 private:
  Level min_level_;
};

const char *levelString(Logger::Level level);

extern void setLogger(std::unique_ptr<Logger> logger);
extern Logger &getLogger();

}  // namespace utils
}  // namespace pbjson

#define PBJSON_STRINGLIT2(x) #x
#define PBJSON_STRINGLIT(x) PBJSON_STRINGLIT2(x)
#define PBJSON_FILE_LINE "[" __FILE__ ":" PBJSON_STRINGLIT(__LINE__) "] "

#define PBJSON_TRACE_ENABLED \
  (pbjson::utils::getLogger().isLoggable(pbjson::utils::Logger::Level::TRACE_))
#define PBJSON_DEBUG_ENABLED \
  (pbjson::utils::getLogger().isLoggable(pbjson::utils::Logger::Level::DEBUG_))
#define PBJSON_INFO_ENABLED \
  (pbjson::utils::getLogger().isLoggable(pbjson::utils::Logger::Level::INFO_))
#define PBJSON_WARN_ENABLED \
  (pbjson::utils::getLogger().isLoggable(pbjson::utils::Logger::Level::WARN_))
#define PBJSON_ERROR_ENABLED \
  (pbjson::utils::getLogger().isLoggable(pbjson::utils::Logger::Level::ERROR_))

#define PBJSON_LOG_INT(LEVEL, FORMAT, ...)                                 \
  pbjson::utils::getLogger().log(pbjson::utils::Logger::Level::LEVEL##_, \
                                 PBJSON_FILE_LINE FORMAT, ##__VA_ARGS__)

#define PBJSON_TRACE(FORMAT, ...)                    \
  do {                                               \
    if (PBJSON_TRACE_ENABLED) {                      \
      PBJSON_LOG_INT(TRACE, FORMAT, ##__VA_ARGS__); \
    }                                                \
  } while (0)

#define PBJSON_DEBUG(FORMAT, ...)                    \
  do {                                               \
    if (PBJSON_DEBUG_ENABLED) {                      \
      PBJSON_LOG_INT(DEBUG, FORMAT, ##__VA_ARGS__); \
    }                                                \
  } while (0)

#define PBJSON_INFO(FORMAT, ...)                    \
  do {                                              \
    if (PBJSON_INFO_ENABLED) {                      \
      PBJSON_LOG_INT(INFO, FORMAT, ##__VA_ARGS__); \
    }                                               \
  } while (0)

#define PBJSON_WARN(FORMAT, ...)                    \
  do {                                              \
    if (PBJSON_WARN_ENABLED) {                      \
      PBJSON_LOG_INT(WARN, FORMAT, ##__VA_ARGS__); \
    }                                               \
  } while (0)

#define PBJSON_ERROR(FORMAT, ...)                    \
  do {                                               \
    if (PBJSON_ERROR_ENABLED) {                      \
      PBJSON_LOG_INT(ERROR, FORMAT, ##__VA_ARGS__); \
    }                                                \
  } while (0)
