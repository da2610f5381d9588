/**
 * @file syncfilelogger.hpp
 * @brief Синхронный файловый логгер с резервным файлом и ротацией
 */

#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "steward/ilogger.hpp"
#include "steward/irotatablelogger.hpp"

namespace steward {

/**
 * @class SyncFileLogger
 * @brief Пишет каждое сообщение в основной файл с немедленным flush
 *
 * @details
 * Если основной файл не открывается, сообщения уходят в резервный файл.
 * Если недоступны оба файла, выполняется попытка переоткрыть их, а
 * диагностика выводится в stderr.
 */
class SyncFileLogger : public ILogger, public IRotatableLogger {
 public:
  static SyncFileLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void setRotationConfig(const RotationConfig& config) override;
  RotationConfig getRotationConfig() const override;

  void setMainLogPath(const std::string& path);
  void setFallbackLogPath(const std::string& path);
  std::string getMainLogPath() const;
  std::string getFallbackLogPath() const;

 protected:
  SyncFileLogger() = default;
  void log(LogLevel level, const std::string& message) override;

 private:
  void reopenFilesLocked();
  void rotateIfNeededLocked(std::size_t incomingBytes);
  void writeLocked(const std::string& line);

  mutable std::mutex mutex_;
  std::ofstream mainLogFile_;
  std::ofstream fallbackLogFile_;
  std::string mainLogPath_ = "nodesteward.log";
  std::string fallbackLogPath_ = "nodesteward_fallback.log";
  RotationConfig rotationConfig_;
  bool warnedAboutFallback_ = false;
};

}  // namespace steward
