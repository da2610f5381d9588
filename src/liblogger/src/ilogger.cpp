#include "steward/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool steward::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    std::cerr << "[LOGGER ERROR] Empty time format rejected" << std::endl;
    return false;
  }
  std::lock_guard lock(formatMutex_);
  globalFormat_ = fmt;
  return true;
}

std::string steward::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  std::string fmt;
  {
    std::lock_guard lock(formatMutex_);
    fmt = globalFormat_;
  }

  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tmLocal{};
  if (localtime_r(&tt, &tmLocal) == nullptr) {
    return "[INVALID_TIME]";
  }

  std::ostringstream oss;
  oss << std::put_time(&tmLocal, fmt.c_str());
  return oss.str();
}

steward::LogLevel steward::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void steward::ILogger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void steward::ILogger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void steward::ILogger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void steward::ILogger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void steward::ILogger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

bool steward::ILogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

std::string steward::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

steward::LogLevel steward::stringToLogLevel(const std::string& level) {
  std::string lowered = level;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug") return LogLevel::LOG_DEBUG;
  if (lowered == "info") return LogLevel::LOG_INFO;
  if (lowered == "warning" || lowered == "warn") return LogLevel::LOG_WARNING;
  if (lowered == "error") return LogLevel::LOG_ERROR;
  if (lowered == "critical") return LogLevel::LOG_CRITICAL;

  throw std::invalid_argument("Unknown log level: " + level);
}
