/**
 * @file processsupervisor.hpp
 * @date October 2026
 * @brief Запуск, остановка и проверка процессов узлов
 *
 * @details
 * IProcessSupervisor отделяет оркестратор от ОС. Команды launch() и
 * terminate() только инициируют переход и не ждут его завершения;
 * наблюдение выполняется через healthProbe().
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>

#include "nodeconfig.hpp"

struct HealthStatus {
  bool isRunning = false;
  std::optional<pid_t> pid;
};

class IProcessSupervisor {
 public:
  virtual ~IProcessSupervisor() = default;

  /// @throw SupervisorError Команда не принята
  virtual void launch(const NodeConfig &config) = 0;

  /// @throw SupervisorError Команда не принята
  virtual void terminate(const NodeConfig &config) = 0;

  /// @throw SupervisorError Состояние невозможно определить
  virtual HealthStatus healthProbe(const NodeConfig &config) = 0;
};

/**
 * @class PosixProcessSupervisor
 * @brief Реализация через fork/setsid/exec и PID-файл
 *
 * @details
 * Узел запускается сценарием start-node.sh из каталога конфигурации.
 * Двойной fork отвязывает процесс от CLI, PID внука передаётся через
 * pipe и записывается в <config>/node.pid. Остановка посылает SIGTERM.
 * Проверка считает узел запущенным, если процесс из PID-файла жив и,
 * при probePort, HTTP-порт принимает TCP-соединения.
 */
class PosixProcessSupervisor : public IProcessSupervisor {
 public:
  explicit PosixProcessSupervisor(
      bool probePort = true,
      std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(500));

  void launch(const NodeConfig &config) override;
  void terminate(const NodeConfig &config) override;
  HealthStatus healthProbe(const NodeConfig &config) override;

  static std::string pidFilePath(const NodeConfig &config);
  static std::string launcherPath(const NodeConfig &config);

 private:
  bool portAcceptsConnections(const std::string &host, int port) const;

  bool probePort_;
  std::chrono::milliseconds connectTimeout_;
};
