/**
 * @file service_controller.hpp
 * @date October 2026
 * @brief Управляющий класс CLI nodesteward
 *
 * @details
 * Последовательность run():
 * 1. Разбор аргументов (ArgumentParser)
 * 2. Загрузка конфигурации и CLI overrides (ConfigManager)
 * 3. Настройка журналирования (initLogger)
 * 4. Создание реестра, супервизора и NodeOrchestrator
 * 5. Регистрация SIGINT/SIGTERM: закрытие сеанса управления
 * 6. Выполнение команды и выбор кода завершения
 *
 * Сигнал во время `--wait` прекращает только ожидание; команда, переданная
 * процессу узла, не отменяется.
 */

#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "../include/argumentparser.hpp"
#include "../include/cancellation.hpp"
#include "../include/nodeorchestrator.hpp"
#include "../include/processsupervisor.hpp"
#include "../include/systemmemory.hpp"
#include "../include/waitstrategy.hpp"

/// Коды завершения nodesteward
enum ExitCode : int {
  EXIT_OK = 0,
  EXIT_FAILED = 1,
  EXIT_BAD_ARGS = 2,
  EXIT_CONFLICT = 3,
  EXIT_GUARD = 4,
  EXIT_TIMEOUT = 5,
  EXIT_CANCELLED = 6
};

class ServiceController {
 public:
  ServiceController() = default;
  ~ServiceController();

  int run(int argc, char **argv);

 private:
  void initLogger(const ParsedArgs &args);
  void buildOrchestrator(const ParsedArgs &args);
  void registerSignals();

  int dispatch(const ParsedArgs &args);
  int awaitTicket(const ReconcileTicket &ticket, const ParsedArgs &args);

  nlohmann::json readJsonFile(const std::string &path) const;
  void printNode(const NodeConfig &config, const ParsedArgs &args) const;
  void printValidation(const ValidationResult &result) const;

  void printHelp() const;
  void printVersion() const;

  ManagementSession session_;
  std::unique_ptr<NodeRegistry> registry_;
  std::unique_ptr<IProcessSupervisor> supervisor_;
  std::unique_ptr<ISystemMemoryReporter> memory_;
  std::unique_ptr<IWaitStrategy> wait_;
  std::unique_ptr<NodeOrchestrator> orchestrator_;
  bool signalsRegistered_ = false;
};
