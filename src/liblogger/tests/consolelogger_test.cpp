#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

#include "steward/consolelogger.hpp"

// Перехват std::cout на время теста
class CaptureStream {
 public:
  explicit CaptureStream(std::ostream& stream)
      : stream_(stream), old_(stream.rdbuf(buffer_.rdbuf())) {}
  ~CaptureStream() { stream_.rdbuf(old_); }
  std::string str() const { return buffer_.str(); }

 private:
  std::ostream& stream_;
  std::stringstream buffer_;
  std::streambuf* old_;
};

class ConsoleLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_ = &steward::ConsoleLogger::instance();
    logger_->init(steward::LogLevel::LOG_DEBUG);
    logger_->setColorEnabled(false);
  }
  void TearDown() override { logger_->setColorEnabled(true); }

  steward::ConsoleLogger* logger_;
};

TEST_F(ConsoleLoggerTest, WritesLevelAndMessage) {
  CaptureStream capture(std::cout);
  logger_->warning("port 9200 is busy");
  logger_->flush();

  const auto out = capture.str();
  EXPECT_NE(out.find("[WARNING]"), std::string::npos);
  EXPECT_NE(out.find("port 9200 is busy"), std::string::npos);
  EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST_F(ConsoleLoggerTest, ColorsWhenEnabled) {
  logger_->setColorEnabled(true);
  CaptureStream capture(std::cout);
  logger_->error("colored");
  logger_->flush();

  const auto out = capture.str();
  EXPECT_NE(out.find("\033["), std::string::npos);
  EXPECT_NE(out.find(STEWARD_ANSI_RESET), std::string::npos);
}

TEST_F(ConsoleLoggerTest, RespectsLogLevel) {
  logger_->setLogLevel(steward::LogLevel::LOG_ERROR);
  CaptureStream capture(std::cout);
  logger_->info("hidden");
  logger_->critical("shown");
  logger_->flush();

  const auto out = capture.str();
  EXPECT_EQ(out.find("hidden"), std::string::npos);
  EXPECT_NE(out.find("shown"), std::string::npos);
}
