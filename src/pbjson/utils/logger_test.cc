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

#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace pbjson {
namespace utils {

class CountingArgument {
 public:
  const char* c_str() {
    ++to_string_calls;
    return "logged entity";
  }

  int to_string_calls{0};
};

class CountingLogger : public Logger {
 public:
  CountingLogger(int& is_loggable_calls, std::vector<std::string>& lines)
      : is_loggable_calls_(is_loggable_calls), lines_(lines) {}

  bool isLoggable(Level level) override {
    ++is_loggable_calls_;
    return level != Level::TRACE_ && level != Level::DEBUG_;
  }

  void writeBuffer(Level level, const char* buffer) override {
    lines_.push_back(std::string(levelString(level)) + " " + buffer);
  }

 private:
  int& is_loggable_calls_;
  std::vector<std::string>& lines_;
};

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    setLogger(std::unique_ptr<Logger>(
        new CountingLogger(is_loggable_calls_, lines_)));
    is_loggable_calls_ = 0;
    lines_.clear();
  }

  void TearDown() override { setLogger(nullptr); }

  int is_loggable_calls_{0};
  std::vector<std::string> lines_;
};

TEST_F(LoggerTest, SkipsArgumentsBelowThreshold) {
  CountingArgument entity;

  PBJSON_TRACE("%s", entity.c_str());
  PBJSON_DEBUG("%s", entity.c_str());

  EXPECT_EQ(0, entity.to_string_calls);
  EXPECT_EQ(2, is_loggable_calls_);
  EXPECT_TRUE(lines_.empty());
}

TEST_F(LoggerTest, EvaluatesArgumentsOnceWhenLoggable) {
  CountingArgument entity;

  PBJSON_INFO("%s", entity.c_str());
  PBJSON_WARN("%s", entity.c_str());
  PBJSON_ERROR("%s", entity.c_str());

  EXPECT_EQ(3, entity.to_string_calls);
  // The macro checks isLoggable and so does Logger::log.
  EXPECT_EQ(6, is_loggable_calls_);
  ASSERT_EQ(3u, lines_.size());
  EXPECT_EQ(0u, lines_[0].find("INFO ["));
  EXPECT_NE(std::string::npos, lines_[0].find("logger_test.cc"));
  EXPECT_NE(std::string::npos, lines_[2].find("] logged entity"));
}

TEST_F(LoggerTest, TruncatesLongMessages) {
  std::string huge(4096, 'x');
  PBJSON_ERROR("%s", huge.c_str());

  ASSERT_EQ(1u, lines_.size());
  EXPECT_LT(lines_[0].size(), huge.size());
}

TEST(StderrLoggerTest, HonorsMinimumLevel) {
  StderrLogger logger(Logger::Level::WARN_);
  EXPECT_FALSE(logger.isLoggable(Logger::Level::TRACE_));
  EXPECT_FALSE(logger.isLoggable(Logger::Level::DEBUG_));
  EXPECT_FALSE(logger.isLoggable(Logger::Level::INFO_));
  EXPECT_TRUE(logger.isLoggable(Logger::Level::WARN_));
  EXPECT_TRUE(logger.isLoggable(Logger::Level::ERROR_));
}

TEST(StderrLoggerTest, DefaultLoggerRestoredOnNull) {
  setLogger(nullptr);
  EXPECT_FALSE(getLogger().isLoggable(Logger::Level::DEBUG_));
  EXPECT_TRUE(getLogger().isLoggable(Logger::Level::INFO_));
}

}  // namespace utils
}  // namespace pbjson
