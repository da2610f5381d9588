#include "../include/nodeorchestrator.hpp"

#include <map>
#include <set>

#include "../include/errors.hpp"
#include "../include/nodeinvariants.hpp"
#include "steward/compositelogger.hpp"

namespace {

steward::CompositeLogger &logger() { return steward::CompositeLogger::instance(); }

NodeConfig mergedOrThrow(const NodeConfig &current, const nlohmann::json &patch) {
  try {
    return current.merged(patch);
  } catch (const std::invalid_argument &e) {
    throw InvalidRequestError(e.what());
  }
}

// Ключи блокировок каталогов узла: корень, data, logs
std::vector<std::string> layoutKeys(const NodeConfig &config) {
  const auto layout = NodeMaterializer::layoutOf(config);
  std::vector<std::string> keys;
  for (const auto &dir : {layout.root, layout.dataDir, layout.logsDir}) {
    auto normal = dir.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path()) {
      normal = normal.parent_path();
    }
    keys.push_back(normal.string());
  }
  return keys;
}

std::vector<std::string> layoutKeys(const NodeConfig &first,
                                    const NodeConfig &second) {
  auto keys = layoutKeys(first);
  for (auto &key : layoutKeys(second)) keys.push_back(std::move(key));
  return keys;
}

}  // namespace

nlohmann::json NodeView::toJson() const {
  auto out = config.toJson();
  out["state"] = nodeStateToString(observation.state);
  out["isRunning"] = isRunning();
  if (observation.pid) out["pid"] = *observation.pid;
  return out;
}

nlohmann::json ClusterStatus::toJson() const {
  return {{"name", name},
          {"nodes", members},
          {"nodeCount", members.size()},
          {"running", running},
          {"stopped", stopped}};
}

NodeOrchestrator::NodeOrchestrator(OrchestratorSettings settings,
                                   NodeRegistry &registry,
                                   IProcessSupervisor &supervisor,
                                   const ISystemMemoryReporter &memory,
                                   IWaitStrategy &wait)
    : settings_(std::move(settings)),
      registry_(registry),
      validator_(std::make_shared<const NodeValidator>(memory,
                                                       settings_.validator)),
      materializer_({settings_.basePath, settings_.engineExecutable}),
      reconciler_(registry, supervisor, wait, settings_.start, settings_.stop) {}

NodeOrchestrator::~NodeOrchestrator() {
  std::vector<ValidationJob> jobs;
  {
    std::lock_guard lock(jobsMutex_);
    jobs.swap(validationJobs_);
  }
  for (auto &job : jobs) {
    if (job.thread.joinable()) job.thread.join();
  }
}

void NodeOrchestrator::reapValidationsLocked() {
  for (auto it = validationJobs_.begin(); it != validationJobs_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = validationJobs_.erase(it);
    } else {
      ++it;
    }
  }
}

ValidationResult NodeOrchestrator::runValidation(
    const NodeConfig &candidate, ValidationMode mode,
    const std::optional<std::string> &originalName) {
  auto snapshot = registry_.snapshot();

  std::packaged_task<ValidationResult()> task(
      [validator = validator_, candidate, mode, snapshot = std::move(snapshot),
       originalName]() {
        return validator->validate(candidate, mode, snapshot, originalName);
      });
  auto future = task.get_future();
  auto done = std::make_shared<std::atomic<bool>>(false);

  {
    std::lock_guard lock(jobsMutex_);
    reapValidationsLocked();
    validationJobs_.push_back(
        {std::thread([task = std::move(task), done]() mutable {
           task();
           done->store(true);
         }),
         done});
  }

  if (future.wait_for(settings_.validationTimeout) != std::future_status::ready) {
    throw ValidationTimeoutError(
        "NodeOrchestrator: Validation of node \"" + candidate.name +
        "\" exceeded " + std::to_string(settings_.validationTimeout.count()) +
        " ms");
  }
  auto result = future.get();
  for (const auto &warning : result.warnings) {
    logger().warning("NodeOrchestrator: " + warning);
  }
  return result;
}

void NodeOrchestrator::requireValid(const ValidationResult &result,
                                    const std::string &action) const {
  if (result.valid) return;
  logger().warning("NodeOrchestrator: " + action + " rejected: " +
                   result.summary());
  throw ConflictError(result);
}

NodeConfig NodeOrchestrator::requireNode(const std::string &name) const {
  auto config = registry_.find(name);
  if (!config) throw NodeNotFoundError(name);
  return *config;
}

void NodeOrchestrator::ensureIdle(const std::string &name,
                                  const std::string &operation) {
  if (reconciler_.isReconciling(name)) {
    const auto state = reconciler_.stateOf(name).value_or(NodeState::Starting);
    throw GuardViolation(name, nodeStateToString(state), operation);
  }

  const auto observation = reconciler_.refresh(name);
  switch (observation.state) {
    case NodeState::Stopped:
      return;
    case NodeState::Running:
    case NodeState::Starting:
    case NodeState::Stopping:
    case NodeState::Unreachable:
      throw GuardViolation(name, nodeStateToString(observation.state),
                           operation);
  }
}

ValidationResult NodeOrchestrator::validate(
    const NodeConfig &candidate,
    const std::optional<std::string> &originalName) {
  const auto current =
      originalName ? registry_.find(*originalName) : std::nullopt;
  const NodeLayout layout = current
                                ? NodeMaterializer::layoutOf(*current)
                                : materializer_.defaultLayout(candidate.name);
  const NodeConfig bound = NodeMaterializer::bind(candidate, layout);
  return runValidation(bound,
                       originalName ? ValidationMode::Update
                                    : ValidationMode::Create,
                       originalName);
}

NodeConfig NodeOrchestrator::create(NodeConfig candidate) {
  auto guard = locks_.lock(candidate.name);

  candidate = NodeMaterializer::bind(
      candidate, materializer_.defaultLayout(candidate.name));
  requireValid(runValidation(candidate, ValidationMode::Create, std::nullopt),
               "Create of \"" + candidate.name + "\"");

  auto paths = pathLocks_.lockAll(layoutKeys(candidate));
  auto txn = materializer_.create(candidate);
  registry_.insert(candidate);
  txn.commit();

  logger().info("NodeOrchestrator: Node \"" + candidate.name +
                "\" created in cluster \"" + candidate.cluster + "\"");
  return candidate;
}

NodeConfig NodeOrchestrator::update(const std::string &name,
                                    const nlohmann::json &patch) {
  const NodeConfig requested = mergedOrThrow(requireNode(name), patch);
  auto guard = locks_.lockPair(name, requested.name);

  const NodeConfig current = requireNode(name);
  NodeConfig updated = mergedOrThrow(current, patch);
  updated.configPath = current.configPath;
  if (updated.name != requested.name) {
    throw InvalidRequestError("NodeOrchestrator: Node \"" + name +
                              "\" changed during update");
  }

  ensureIdle(name, "update");
  requireValid(runValidation(updated, ValidationMode::Update, name),
               "Update of \"" + name + "\"");

  auto paths = pathLocks_.lockAll(layoutKeys(current, updated));
  try {
    auto txn = materializer_.reconfigure(current, updated);
    registry_.replace(name, updated);
    txn.commit();
  } catch (const std::exception &) {
    try {
      materializer_.rewriteConfig(current);
    } catch (const std::exception &e) {
      logger().error("NodeOrchestrator: Cannot restore configuration of \"" +
                     name + "\": " + e.what());
    }
    throw;
  }

  if (updated.name != name) reconciler_.forget(name);
  logger().info("NodeOrchestrator: Node \"" + name + "\" updated");
  return updated;
}

NodeConfig NodeOrchestrator::setCluster(const std::string &name,
                                        const std::string &cluster) {
  if (cluster.empty()) {
    throw InvalidRequestError("NodeOrchestrator: Cluster name must not be empty");
  }
  return update(name, {{"cluster", cluster}});
}

NodeConfig NodeOrchestrator::move(const std::string &name,
                                  const std::string &targetBasePath,
                                  bool preserveData) {
  if (targetBasePath.empty()) {
    throw InvalidRequestError("NodeOrchestrator: Target path must not be empty");
  }
  auto guard = locks_.lock(name);

  const NodeConfig current = requireNode(name);
  ensureIdle(name, "move");

  const NodeConfig target = NodeMaterializer::bind(
      current, NodeLayout::at(targetBasePath), true);
  requireValid(runValidation(target, ValidationMode::Update, name),
               "Move of \"" + name + "\"");

  auto paths = pathLocks_.lockAll(layoutKeys(current, target));
  auto txn = materializer_.relocate(current, target, preserveData);
  registry_.replace(name, target);
  txn.commit();

  logger().info("NodeOrchestrator: Node \"" + name + "\" moved to " +
                NodeMaterializer::layoutOf(target).root.string() +
                (preserveData ? "" : " (data discarded)"));
  return target;
}

NodeConfig NodeOrchestrator::copy(const std::string &name,
                                  const std::string &newName,
                                  const std::string &targetBasePath,
                                  bool copyData) {
  if (newName.empty()) {
    throw InvalidRequestError("NodeOrchestrator: New node name must not be empty");
  }
  auto guard = locks_.lockPair(name, newName);

  const NodeConfig source = requireNode(name);
  if (!settings_.allowCopyWhileRunning) {
    ensureIdle(name, "copy");
  } else if (reconciler_.refresh(name).state != NodeState::Stopped) {
    logger().warning("NodeOrchestrator: Copying \"" + name +
                     "\" while it is not stopped, the copy may be "
                     "inconsistent");
  }

  NodeConfig target = source;
  target.name = newName;
  const NodeLayout layout = targetBasePath.empty()
                                ? materializer_.defaultLayout(newName)
                                : NodeLayout::at(targetBasePath);
  target = NodeMaterializer::bind(target, layout, true);

  std::set<int> used = collectPorts(registry_.snapshot());
  target.httpPort = validator_->findFreePort(source.httpPort + 1, used);
  used.insert(target.httpPort);
  target.transportPort = validator_->findFreePort(source.transportPort + 1, used);

  requireValid(runValidation(target, ValidationMode::Create, std::nullopt),
               "Copy of \"" + name + "\" to \"" + newName + "\"");

  auto paths = pathLocks_.lockAll(layoutKeys(target));
  auto txn = materializer_.duplicate(source, target, copyData);
  registry_.insert(target);
  txn.commit();

  logger().info("NodeOrchestrator: Node \"" + name + "\" copied to \"" +
                newName + "\" (HTTP " + std::to_string(target.httpPort) +
                ", transport " + std::to_string(target.transportPort) + ")");
  return target;
}

void NodeOrchestrator::remove(const std::string &name, bool preserveData) {
  auto guard = locks_.lock(name);

  const NodeConfig current = requireNode(name);
  ensureIdle(name, "delete");

  auto paths = pathLocks_.lockAll(layoutKeys(current));
  registry_.remove(name);
  reconciler_.forget(name);
  materializer_.remove(current, preserveData);

  logger().info("NodeOrchestrator: Node \"" + name + "\" deleted" +
                (preserveData ? " (data preserved)" : ""));
}

ReconcileTicket NodeOrchestrator::start(const std::string &name,
                                        CancellationToken token) {
  auto guard = locks_.lock(name);
  return reconciler_.start(name, std::move(token));
}

ReconcileTicket NodeOrchestrator::stop(const std::string &name,
                                       CancellationToken token) {
  auto guard = locks_.lock(name);
  return reconciler_.stop(name, std::move(token));
}

std::vector<NodeView> NodeOrchestrator::list() {
  std::vector<NodeView> views;
  for (const auto &config : registry_.snapshot()) {
    try {
      views.push_back({config, reconciler_.refresh(config.name)});
    } catch (const NodeNotFoundError &) {
      // удалён между снимком и проверкой
    }
  }
  return views;
}

NodeView NodeOrchestrator::getNode(const std::string &name) {
  const NodeConfig config = requireNode(name);
  return {config, reconciler_.refresh(name)};
}

std::vector<ClusterStatus> NodeOrchestrator::clusterStatus() {
  std::map<std::string, bool> running;
  for (const auto &view : list()) {
    running[view.config.name] = view.isRunning();
  }

  std::vector<ClusterStatus> out;
  for (const auto &cluster : registry_.clusters()) {
    ClusterStatus status{cluster.name, cluster.members};
    for (const auto &member : cluster.members) {
      if (running[member]) {
        ++status.running;
      } else {
        ++status.stopped;
      }
    }
    out.push_back(std::move(status));
  }
  return out;
}

IntegrityReport NodeOrchestrator::verify() const {
  return registry_.verify(materializer_.nodesRoot().string());
}
