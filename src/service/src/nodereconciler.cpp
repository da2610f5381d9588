#include "../include/nodereconciler.hpp"

#include "../include/errors.hpp"
#include "steward/compositelogger.hpp"

namespace {

steward::CompositeLogger &logger() { return steward::CompositeLogger::instance(); }

NodeState settledState(bool running) {
  return running ? NodeState::Running : NodeState::Stopped;
}

}  // namespace

std::string nodeStateToString(NodeState state) {
  switch (state) {
    case NodeState::Stopped:
      return "stopped";
    case NodeState::Starting:
      return "starting";
    case NodeState::Running:
      return "running";
    case NodeState::Stopping:
      return "stopping";
    case NodeState::Unreachable:
      return "unreachable";
  }
  return "unknown";
}

std::string reconcileOutcomeToString(ReconcileOutcome outcome) {
  switch (outcome) {
    case ReconcileOutcome::Converged:
      return "converged";
    case ReconcileOutcome::TimedOut:
      return "timed_out";
    case ReconcileOutcome::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

NodeReconciler::NodeReconciler(NodeRegistry &registry,
                               IProcessSupervisor &supervisor,
                               IWaitStrategy &wait,
                               ReconcilePolicy startPolicy,
                               ReconcilePolicy stopPolicy)
    : registry_(registry),
      supervisor_(supervisor),
      wait_(wait),
      startPolicy_(startPolicy),
      stopPolicy_(stopPolicy) {}

NodeReconciler::~NodeReconciler() {
  shuttingDown_ = true;

  std::vector<Worker> workers;
  {
    std::lock_guard lock(mutex_);
    workers.swap(workers_);
  }
  for (auto &worker : workers) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

ReconcileTicket NodeReconciler::start(const std::string &name,
                                      CancellationToken token) {
  return request(name, true, std::move(token));
}

ReconcileTicket NodeReconciler::stop(const std::string &name,
                                     CancellationToken token) {
  return request(name, false, std::move(token));
}

void NodeReconciler::reapWorkersLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

bool NodeReconciler::abandoned(const Flight &flight) const {
  if (shuttingDown_) return true;
  std::lock_guard lock(mutex_);
  for (const auto &token : flight.waiters) {
    if (!token.isCancelled()) return false;
  }
  return true;
}

void NodeReconciler::failFlight(const std::string &name,
                                const std::shared_ptr<Flight> &flight,
                                std::exception_ptr error) {
  {
    std::lock_guard lock(mutex_);
    auto it = flights_.find(name);
    if (it != flights_.end() && it->second == flight) flights_.erase(it);
  }
  flight->promise.set_exception(error);
}

ReconcileTicket NodeReconciler::request(const std::string &name,
                                        bool desiredRunning,
                                        CancellationToken token) {
  const auto config = registry_.find(name);
  if (!config) throw NodeNotFoundError(name);

  const char *verb = desiredRunning ? "start" : "stop";
  std::shared_ptr<Flight> flight;
  {
    std::lock_guard lock(mutex_);
    reapWorkersLocked();

    if (auto it = flights_.find(name); it != flights_.end()) {
      if (it->second->desiredRunning != desiredRunning) {
        throw ReconcileBusyError(name);
      }
      it->second->waiters.push_back(token);
      logger().info("NodeReconciler: " + std::string(verb) + " of \"" + name +
                    "\" joined the running reconciliation");
      return {name, false, true, it->second->future};
    }

    flight = std::make_shared<Flight>();
    flight->desiredRunning = desiredRunning;
    flight->waiters.push_back(token);
    flight->future = flight->promise.get_future().share();
    flights_[name] = flight;
  }

  HealthStatus initial;
  try {
    initial = supervisor_.healthProbe(*config);
  } catch (const std::exception &e) {
    SupervisorError error("NodeReconciler: Cannot determine state of node \"" +
                          name + "\": " + e.what());
    failFlight(name, flight, std::make_exception_ptr(error));
    throw error;
  }

  if (initial.isRunning == desiredRunning) {
    ReconcileResult result{name, ReconcileOutcome::Converged, 0,
                           settledState(desiredRunning)};
    {
      std::lock_guard lock(mutex_);
      observed_[name] = {result.finalState, initial.pid};
      flights_.erase(name);
    }
    flight->promise.set_value(result);
    logger().info("NodeReconciler: Node \"" + name + "\" is already " +
                  nodeStateToString(result.finalState));
    return {name, true, false, flight->future};
  }

  {
    std::lock_guard lock(mutex_);
    observed_[name] = {desiredRunning ? NodeState::Starting : NodeState::Stopping,
                       initial.pid};
  }

  try {
    if (desiredRunning) {
      supervisor_.launch(*config);
    } else {
      supervisor_.terminate(*config);
    }
  } catch (const std::exception &e) {
    {
      std::lock_guard lock(mutex_);
      observed_[name] = {settledState(initial.isRunning), initial.pid};
    }
    SupervisorError error("NodeReconciler: Failed to " + std::string(verb) +
                          " node \"" + name + "\": " + e.what());
    failFlight(name, flight, std::make_exception_ptr(error));
    throw error;
  }

  const ReconcilePolicy policy = desiredRunning ? startPolicy_ : stopPolicy_;
  logger().info("NodeReconciler: " + std::string(verb) + " command accepted for \"" +
                name + "\", polling up to " + std::to_string(policy.attempts) +
                " times every " + std::to_string(policy.interval.count()) +
                " ms");

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, flight, cfg = *config, policy, done]() {
    runLoop(flight, cfg, policy);
    done->store(true);
  });
  {
    std::lock_guard lock(mutex_);
    workers_.push_back({std::move(thread), done});
  }
  return {name, false, false, flight->future};
}

NodeState NodeReconciler::finalRefresh(const NodeConfig &config) {
  try {
    const auto health = supervisor_.healthProbe(config);
    std::lock_guard lock(mutex_);
    observed_[config.name] = {settledState(health.isRunning), health.pid};
    return settledState(health.isRunning);
  } catch (const std::exception &e) {
    logger().error("NodeReconciler: Final probe of \"" + config.name +
                   "\" failed: " + e.what());
    std::lock_guard lock(mutex_);
    observed_[config.name] = {NodeState::Unreachable, std::nullopt};
    return NodeState::Unreachable;
  }
}

void NodeReconciler::runLoop(std::shared_ptr<Flight> flight, NodeConfig config,
                             ReconcilePolicy policy) {
  try {
    ReconcileResult result{config.name, ReconcileOutcome::TimedOut, 0,
                           NodeState::Stopped};
    const auto cancelled = [this, &flight]() { return abandoned(*flight); };

    while (result.attempts < policy.attempts) {
      if (!wait_.waitFor(policy.interval, cancelled)) {
        result.outcome = ReconcileOutcome::Cancelled;
        break;
      }
      ++result.attempts;

      try {
        const auto health = supervisor_.healthProbe(config);
        if (health.isRunning == flight->desiredRunning) {
          result.outcome = ReconcileOutcome::Converged;
          result.finalState = settledState(health.isRunning);
          std::lock_guard lock(mutex_);
          observed_[config.name] = {result.finalState, health.pid};
          break;
        }
      } catch (const std::exception &e) {
        logger().warning("NodeReconciler: Probe " +
                         std::to_string(result.attempts) + " of \"" +
                         config.name + "\" failed: " + e.what());
      }
    }

    if (!result.converged()) {
      result.finalState = finalRefresh(config);
    }

    {
      std::lock_guard lock(mutex_);
      flights_.erase(config.name);
    }

    const std::string summary =
        "NodeReconciler: Node \"" + config.name + "\" " +
        reconcileOutcomeToString(result.outcome) + " after " +
        std::to_string(result.attempts) + " attempts, state " +
        nodeStateToString(result.finalState);
    if (result.converged()) {
      logger().info(summary);
    } else {
      logger().warning(summary);
    }
    flight->promise.set_value(result);
  } catch (const std::exception &e) {
    logger().error("NodeReconciler: Reconciliation of \"" + config.name +
                   "\" aborted: " + e.what());
    failFlight(config.name, flight, std::current_exception());
  }
}

NodeObservation NodeReconciler::refresh(const std::string &name) {
  const auto config = registry_.find(name);
  if (!config) throw NodeNotFoundError(name);

  {
    std::lock_guard lock(mutex_);
    if (flights_.count(name)) {
      auto it = observed_.find(name);
      if (it != observed_.end()) return it->second;
    }
  }

  NodeObservation observation;
  try {
    const auto health = supervisor_.healthProbe(*config);
    observation = {settledState(health.isRunning), health.pid};
  } catch (const std::exception &e) {
    logger().warning("NodeReconciler: Probe of \"" + name + "\" failed: " +
                     e.what());
    observation = {NodeState::Unreachable, std::nullopt};
  }

  std::lock_guard lock(mutex_);
  if (!flights_.count(name)) observed_[name] = observation;
  return observation;
}

std::optional<NodeState> NodeReconciler::stateOf(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = observed_.find(name);
  if (it == observed_.end()) return std::nullopt;
  return it->second.state;
}

bool NodeReconciler::isReconciling(const std::string &name) const {
  std::lock_guard lock(mutex_);
  return flights_.count(name) > 0;
}

void NodeReconciler::forget(const std::string &name) {
  std::lock_guard lock(mutex_);
  observed_.erase(name);
}
