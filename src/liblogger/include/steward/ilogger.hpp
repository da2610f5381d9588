/**
 * @file ilogger.hpp
 * @date October 2026
 * @brief Базовый интерфейс логгеров NodeSteward и форматирование времени.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace steward {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Единый формат временных меток для всех логгеров процесса
 */
class TimeFormatter {
 public:
  /// Устанавливает формат strftime. Возвращает false, если формат отклонён.
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::mutex formatMutex_;
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

/**
 * @class ILogger
 * @brief Абстрактный приёмник сообщений журнала
 *
 * @details
 * Наследники реализуют log() и фильтрацию по уровню. Публичные методы
 * debug()/info()/... не выбрасывают исключений.
 */
class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразует строковое имя уровня ("debug", "info", ...) в LogLevel
 * @throw std::invalid_argument Для неизвестного имени уровня
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace steward
