/**
 * @file nodeorchestrator.hpp
 * @date October 2026
 * @brief Фасад операций над узлами
 *
 * @details
 * Каждая операция оператора проходит одну и ту же последовательность:
 * блокировка имени узла, проверка состояния процесса, проверка
 * конфигурации, изменение файлов, запись в реестр. Для start/stop вместо
 * изменения файлов команда передаётся NodeReconciler.
 *
 * Изменение конфигурации работающего (или переходящего в другое состояние)
 * узла отклоняется GuardViolation до любых изменений на диске.
 */

#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "nodelocktable.hpp"
#include "nodematerializer.hpp"
#include "nodereconciler.hpp"
#include "noderegistry.hpp"
#include "nodevalidator.hpp"
#include "orchestratorsettings.hpp"

/**
 * @struct NodeView
 * @brief Запись реестра вместе с наблюдаемым состоянием
 */
struct NodeView {
  NodeConfig config;
  NodeObservation observation;

  bool isRunning() const { return observation.isRunning(); }
  nlohmann::json toJson() const;
};

struct ClusterStatus {
  std::string name;
  std::vector<std::string> members;
  int running = 0;
  int stopped = 0;

  nlohmann::json toJson() const;
};

class NodeOrchestrator {
 public:
  NodeOrchestrator(OrchestratorSettings settings, NodeRegistry &registry,
                   IProcessSupervisor &supervisor,
                   const ISystemMemoryReporter &memory, IWaitStrategy &wait);
  ~NodeOrchestrator();

  NodeOrchestrator(const NodeOrchestrator &) = delete;
  NodeOrchestrator &operator=(const NodeOrchestrator &) = delete;

  /**
   * @brief Проверяет кандидата без изменений
   *
   * @details
   * С originalName выполняется проверка обновления этой записи.
   * Пустые dataPath/logsPath перед проверкой заменяются стандартным
   * расположением узла.
   *
   * @throw ValidationTimeoutError, ResourceExhaustionError
   */
  ValidationResult validate(
      const NodeConfig &candidate,
      const std::optional<std::string> &originalName = std::nullopt);

  /**
   * @brief Создаёт узел
   * @return Зарегистрированная запись с заполненными путями
   * @throw ConflictError, FilesystemError
   */
  NodeConfig create(NodeConfig candidate);

  /**
   * @brief Применяет частичное обновление (в том числе переименование)
   * @throw NodeNotFoundError, GuardViolation, ConflictError,
   *        InvalidRequestError, FilesystemError
   */
  NodeConfig update(const std::string &name, const nlohmann::json &patch);

  /// Перенос узла в другой кластер
  NodeConfig setCluster(const std::string &name, const std::string &cluster);

  /**
   * @brief Переносит каталог узла в targetBasePath
   *
   * @details
   * targetBasePath становится каталогом узла (config, data, logs внутри).
   * Реестр обновляется только после успешного копирования; старые
   * каталоги удаляются после записи в реестр.
   *
   * @param preserveData false: новый узел получает пустые data и logs
   */
  NodeConfig move(const std::string &name, const std::string &targetBasePath,
                  bool preserveData);

  /**
   * @brief Создаёт копию узла под именем newName
   *
   * @details
   * Порты подбираются заново: первые свободные выше портов источника.
   * Пустой targetBasePath означает стандартное расположение.
   */
  NodeConfig copy(const std::string &name, const std::string &newName,
                  const std::string &targetBasePath, bool copyData);

  /**
   * @brief Удаляет узел из реестра и с диска
   * @param preserveData Сохранить data и logs, удалить только конфигурацию
   */
  void remove(const std::string &name, bool preserveData);

  ReconcileTicket start(const std::string &name,
                        CancellationToken token = CancellationToken());
  ReconcileTicket stop(const std::string &name,
                       CancellationToken token = CancellationToken());

  /// Все узлы со свежей проверкой состояния
  std::vector<NodeView> list();

  /// @throw NodeNotFoundError
  NodeView getNode(const std::string &name);

  std::vector<ClusterStatus> clusterStatus();

  IntegrityReport verify() const;

  const OrchestratorSettings &settings() const { return settings_; }
  NodeReconciler &reconciler() { return reconciler_; }
  const NodeMaterializer &materializer() const { return materializer_; }

 private:
  ValidationResult runValidation(const NodeConfig &candidate,
                                 ValidationMode mode,
                                 const std::optional<std::string> &originalName);
  void requireValid(const ValidationResult &result, const std::string &action) const;
  void ensureIdle(const std::string &name, const std::string &operation);
  NodeConfig requireNode(const std::string &name) const;
  void reapValidationsLocked();

  OrchestratorSettings settings_;
  NodeRegistry &registry_;
  std::shared_ptr<const NodeValidator> validator_;
  NodeMaterializer materializer_;
  NodeReconciler reconciler_;
  NodeLockTable locks_;
  NodeLockTable pathLocks_;

  struct ValidationJob {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::mutex jobsMutex_;
  std::vector<ValidationJob> validationJobs_;
};
