#include "steward/consolelogger.hpp"

#include <iostream>
#include <sstream>

steward::ConsoleLogger& steward::ConsoleLogger::instance() {
  static ConsoleLogger instance;
  return instance;
}

void steward::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void steward::ConsoleLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void steward::ConsoleLogger::setColorEnabled(bool enabled) {
  colorEnabled_.store(enabled);
}

void steward::ConsoleLogger::flush() {
  std::lock_guard lock(mutex_);
  std::cout.flush();
}

void steward::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  std::lock_guard lock(mutex_);
  try {
    if (colorEnabled_.load()) {
      std::cout << colorFor(level) << formatted.str() << STEWARD_ANSI_RESET
                << '\n';
    } else {
      std::cout << formatted.str() << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "[LOGGER ERROR: " << e.what() << "] " << formatted.str()
              << std::endl;
  }
}

const char* steward::ConsoleLogger::colorFor(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return STEWARD_ANSI_RESET;
}
