#pragma once

#include "steward/ilogger.hpp"

#define STEWARD_ANSI_RESET "\033[0m"

namespace steward {

/**
 * @class ConsoleLogger
 * @brief Вывод журнала в stdout с цветовой маркировкой уровня
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  /// Отключает ANSI-последовательности (например, при выводе не в терминал)
  void setColorEnabled(bool enabled);

 protected:
  ConsoleLogger() = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  static const char* colorFor(LogLevel level);

  mutable std::mutex mutex_;
  std::atomic<bool> colorEnabled_{true};
};

}  // namespace steward
