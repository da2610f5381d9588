/**
 * @file nodereconciler.hpp
 * @date October 2026
 * @brief Согласование желаемого и наблюдаемого состояния процесса узла
 *
 * @details
 * Состояния: stopped -> starting -> running, running -> stopping -> stopped
 * и unreachable, если состояние не удалось определить при итоговой
 * проверке.
 *
 * start()/stop() отдают команду IProcessSupervisor и сразу возвращают
 * ReconcileTicket; опрос выполняется в отдельном потоке. Для каждого имени
 * существует не более одного цикла опроса: повторный запрос того же
 * направления присоединяется к нему, противоположного отклоняется
 * ReconcileBusyError.
 *
 * Цикл: пауза interval, проверка; не более attempts проверок. Без
 * совпадения (таймаут или отмена всех ожидающих) выполняется одна
 * итоговая проверка, чтобы сохранённое состояние не было устаревшим.
 */

#pragma once

#include <sys/types.h>

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "noderegistry.hpp"
#include "orchestratorsettings.hpp"
#include "processsupervisor.hpp"
#include "waitstrategy.hpp"

enum class NodeState { Stopped, Starting, Running, Stopping, Unreachable };

std::string nodeStateToString(NodeState state);

enum class ReconcileOutcome { Converged, TimedOut, Cancelled };

std::string reconcileOutcomeToString(ReconcileOutcome outcome);

struct ReconcileResult {
  std::string node;
  ReconcileOutcome outcome = ReconcileOutcome::Converged;
  int attempts = 0;
  NodeState finalState = NodeState::Stopped;

  bool converged() const { return outcome == ReconcileOutcome::Converged; }
};

/**
 * @struct ReconcileTicket
 * @brief Подтверждение принятой команды
 */
struct ReconcileTicket {
  std::string node;
  bool alreadyInState = false;  ///< Команда не отдавалась
  bool joined = false;          ///< Присоединён к идущему циклу
  std::shared_future<ReconcileResult> result;
};

/// Наблюдаемое состояние узла
struct NodeObservation {
  NodeState state = NodeState::Stopped;
  std::optional<pid_t> pid;

  bool isRunning() const { return state == NodeState::Running; }
};

class NodeReconciler {
 public:
  NodeReconciler(NodeRegistry &registry, IProcessSupervisor &supervisor,
                 IWaitStrategy &wait, ReconcilePolicy startPolicy,
                 ReconcilePolicy stopPolicy);
  ~NodeReconciler();

  NodeReconciler(const NodeReconciler &) = delete;
  NodeReconciler &operator=(const NodeReconciler &) = delete;

  /**
   * @throw NodeNotFoundError, ReconcileBusyError
   * @throw SupervisorError Команда не принята или состояние не определено
   */
  ReconcileTicket start(const std::string &name,
                        CancellationToken token = CancellationToken());

  /// @copydoc start
  ReconcileTicket stop(const std::string &name,
                       CancellationToken token = CancellationToken());

  /**
   * @brief Проверяет узел и сохраняет наблюдение
   *
   * @details
   * Во время цикла согласования возвращает переходное состояние без
   * обращения к процессу. Исключение проверки даёт Unreachable.
   *
   * @throw NodeNotFoundError
   */
  NodeObservation refresh(const std::string &name);

  std::optional<NodeState> stateOf(const std::string &name) const;
  bool isReconciling(const std::string &name) const;

  /// Забывает наблюдения удалённого узла
  void forget(const std::string &name);

 private:
  struct Flight {
    bool desiredRunning = true;
    std::vector<CancellationToken> waiters;
    std::promise<ReconcileResult> promise;
    std::shared_future<ReconcileResult> future;
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  ReconcileTicket request(const std::string &name, bool desiredRunning,
                          CancellationToken token);
  void runLoop(std::shared_ptr<Flight> flight, NodeConfig config,
               ReconcilePolicy policy);
  bool abandoned(const Flight &flight) const;
  void failFlight(const std::string &name, const std::shared_ptr<Flight> &flight,
                  std::exception_ptr error);
  NodeState finalRefresh(const NodeConfig &config);
  void reapWorkersLocked();

  NodeRegistry &registry_;
  IProcessSupervisor &supervisor_;
  IWaitStrategy &wait_;
  ReconcilePolicy startPolicy_;
  ReconcilePolicy stopPolicy_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Flight>> flights_;
  std::map<std::string, NodeObservation> observed_;
  std::vector<Worker> workers_;
  std::atomic<bool> shuttingDown_{false};
};
