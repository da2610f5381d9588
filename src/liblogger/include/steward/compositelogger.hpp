#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "steward/ilogger.hpp"

namespace steward {

/**
 * @class CompositeLogger
 * @brief Глобальная точка журналирования, рассылающая сообщения всем
 * зарегистрированным приёмникам
 *
 * @details
 * Фильтрация по уровню выполняется вложенными логгерами. Без
 * зарегистрированных приёмников сообщения отбрасываются.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  void addLogger(const std::shared_ptr<ILogger>& logger);
  /// Удаляет все приёмники (переинициализация логирования из CLI и тесты)
  void clear();
  std::size_t size() const;

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  CompositeLogger() = default;
  bool shouldSkipLog(LogLevel) const override { return false; }
  void log(LogLevel level, const std::string& message) override;

 private:
  std::vector<std::shared_ptr<ILogger>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace steward
