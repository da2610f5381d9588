/**
 * @file errors.hpp
 * @date October 2026
 * @brief Иерархия исключений оркестратора
 *
 * @details
 * Все ошибки операций наследуют StewardError и несут ErrorKind, по которому
 * CLI выбирает код завершения. Исход цикла согласования (таймаут, отмена)
 * исключением не является и возвращается в ReconcileResult.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

#include "validationresult.hpp"

enum class ErrorKind {
  Conflict,
  GuardViolation,
  Filesystem,
  ResourceExhaustion,
  NotFound,
  InvalidArgument,
  Supervisor,
  ReconcileBusy,
  Timeout
};

std::string errorKindToString(ErrorKind kind);

class StewardError : public std::runtime_error {
 public:
  StewardError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

/// Мутация отклонена проверкой; результат содержит конфликты и подсказки
class ConflictError : public StewardError {
 public:
  explicit ConflictError(ValidationResult result);

  const ValidationResult &result() const noexcept { return result_; }

 private:
  ValidationResult result_;
};

/// Операция запрещена в текущем состоянии процесса узла
class GuardViolation : public StewardError {
 public:
  GuardViolation(const std::string &node, const std::string &state,
                 const std::string &operation);

  const std::string &node() const noexcept { return node_; }
  const std::string &state() const noexcept { return state_; }

 private:
  std::string node_;
  std::string state_;
};

class FilesystemError : public StewardError {
 public:
  FilesystemError(const std::string &message, const std::string &path,
                  std::error_code code = {});

  const std::string &path() const noexcept { return path_; }
  std::error_code code() const noexcept { return code_; }

 private:
  std::string path_;
  std::error_code code_;
};

/// Поиск свободного порта исчерпал окно
class ResourceExhaustionError : public StewardError {
 public:
  explicit ResourceExhaustionError(const std::string &message)
      : StewardError(ErrorKind::ResourceExhaustion, message) {}
};

class NodeNotFoundError : public StewardError {
 public:
  explicit NodeNotFoundError(const std::string &node)
      : StewardError(ErrorKind::NotFound, "Node \"" + node + "\" not found"),
        node_(node) {}

  const std::string &node() const noexcept { return node_; }

 private:
  std::string node_;
};

class InvalidRequestError : public StewardError {
 public:
  explicit InvalidRequestError(const std::string &message)
      : StewardError(ErrorKind::InvalidArgument, message) {}
};

/// Отказ команды запуска или остановки процесса
class SupervisorError : public StewardError {
 public:
  explicit SupervisorError(const std::string &message)
      : StewardError(ErrorKind::Supervisor, message) {}
};

/// Проверка конфигурации не уложилась в validation_timeout_ms
class ValidationTimeoutError : public StewardError {
 public:
  explicit ValidationTimeoutError(const std::string &message)
      : StewardError(ErrorKind::Timeout, message) {}
};

/// Для узла уже идёт согласование в противоположном направлении
class ReconcileBusyError : public StewardError {
 public:
  explicit ReconcileBusyError(const std::string &node)
      : StewardError(ErrorKind::ReconcileBusy,
                     "Node \"" + node +
                         "\" is already being reconciled in the opposite "
                         "direction") {}
};
