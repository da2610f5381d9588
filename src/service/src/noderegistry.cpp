#include "../include/noderegistry.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>

#include "../include/configloader.hpp"
#include "../include/errors.hpp"
#include "../include/nodeinvariants.hpp"
#include "steward/compositelogger.hpp"

namespace fs = std::filesystem;

NodeRegistry::NodeRegistry(std::string registryFile)
    : registryFile_(std::move(registryFile)) {
  load();
}

void NodeRegistry::load() {
  std::error_code ec;
  if (registryFile_.empty() || !fs::exists(registryFile_, ec)) return;

  ConfigLoader loader;
  const auto document = loader.loadFromFile(registryFile_);
  if (!document.is_object() || !document.contains("nodes") ||
      !document["nodes"].is_object()) {
    throw std::runtime_error("NodeRegistry: Malformed registry file " +
                             registryFile_);
  }

  for (const auto &[name, record] : document["nodes"].items()) {
    auto config = NodeConfig::fromJson(record);
    if (config.name != name) {
      throw std::runtime_error("NodeRegistry: Record key \"" + name +
                               "\" does not match node name \"" + config.name +
                               "\"");
    }
    nodes_.emplace(name, std::move(config));
  }

  steward::CompositeLogger::instance().debug(
      "NodeRegistry: Loaded " + std::to_string(nodes_.size()) +
      " nodes from " + registryFile_);
}

void NodeRegistry::persistLocked() const {
  if (registryFile_.empty()) return;

  nlohmann::json nodes = nlohmann::json::object();
  for (const auto &[name, config] : nodes_) {
    auto record = config.toJson();
    record.erase("nodeUrl");
    nodes[name] = std::move(record);
  }
  const nlohmann::json document = {{"version", 1}, {"nodes", nodes}};

  const fs::path target(registryFile_);
  const fs::path temp = target.string() + ".tmp";
  std::error_code ec;

  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw FilesystemError("NodeRegistry: Cannot create registry directory",
                            target.parent_path().string(), ec);
    }
  }

  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out) {
      throw FilesystemError("NodeRegistry: Cannot open registry file",
                            temp.string(),
                            std::error_code(errno, std::generic_category()));
    }
    out << document.dump(2) << '\n';
    out.flush();
    if (!out) {
      throw FilesystemError("NodeRegistry: Failed to write registry file",
                            temp.string(),
                            std::error_code(errno, std::generic_category()));
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw FilesystemError("NodeRegistry: Failed to replace registry file",
                          target.string(), ec);
  }
}

void NodeRegistry::checkInvariantsLocked(const NodeConfig &candidate,
                                         const std::string &excluded) const {
  std::vector<NodeConfig> others;
  for (const auto &[name, config] : nodes_) {
    if (name != excluded) others.push_back(config);
  }

  ValidationResult result;
  scanUniquenessConflicts(candidate, others, result);
  if (!result.valid) {
    throw ConflictError(std::move(result));
  }
}

std::vector<NodeConfig> NodeRegistry::snapshot() const {
  std::shared_lock lock(mutex_);
  std::vector<NodeConfig> out;
  out.reserve(nodes_.size());
  for (const auto &[name, config] : nodes_) out.push_back(config);
  return out;
}

std::optional<NodeConfig> NodeRegistry::find(const std::string &name) const {
  std::shared_lock lock(mutex_);
  auto it = nodes_.find(name);
  if (it == nodes_.end()) return std::nullopt;
  return it->second;
}

bool NodeRegistry::contains(const std::string &name) const {
  std::shared_lock lock(mutex_);
  return nodes_.count(name) > 0;
}

size_t NodeRegistry::size() const {
  std::shared_lock lock(mutex_);
  return nodes_.size();
}

void NodeRegistry::insert(const NodeConfig &config) {
  std::unique_lock lock(mutex_);
  checkInvariantsLocked(config, {});

  nodes_.emplace(config.name, config);
  try {
    persistLocked();
  } catch (...) {
    nodes_.erase(config.name);
    throw;
  }
}

void NodeRegistry::replace(const std::string &originalName,
                           const NodeConfig &updated) {
  std::unique_lock lock(mutex_);
  auto it = nodes_.find(originalName);
  if (it == nodes_.end()) {
    throw NodeNotFoundError(originalName);
  }
  checkInvariantsLocked(updated, originalName);

  const NodeConfig previous = it->second;
  nodes_.erase(it);
  nodes_.emplace(updated.name, updated);
  try {
    persistLocked();
  } catch (...) {
    nodes_.erase(updated.name);
    nodes_.emplace(originalName, previous);
    throw;
  }
}

bool NodeRegistry::remove(const std::string &name) {
  std::unique_lock lock(mutex_);
  auto it = nodes_.find(name);
  if (it == nodes_.end()) return false;

  const NodeConfig previous = it->second;
  nodes_.erase(it);
  try {
    persistLocked();
  } catch (...) {
    nodes_.emplace(name, previous);
    throw;
  }
  return true;
}

std::vector<ClusterInfo> NodeRegistry::clusters() const {
  std::shared_lock lock(mutex_);
  std::map<std::string, std::vector<std::string>> grouped;
  for (const auto &[name, config] : nodes_) {
    grouped[config.cluster].push_back(name);
  }

  std::vector<ClusterInfo> out;
  for (auto &[cluster, members] : grouped) {
    out.push_back({cluster, std::move(members)});
  }
  return out;
}

IntegrityReport NodeRegistry::verify(const std::string &nodesRoot) const {
  std::shared_lock lock(mutex_);
  IntegrityReport report;
  std::error_code ec;

  std::set<std::string> knownDirs;
  for (const auto &[name, config] : nodes_) {
    if (config.configPath.empty() || !fs::exists(config.configPath, ec)) {
      report.issues.push_back("Node \"" + name +
                              "\": configuration file is missing: " +
                              config.configPath);
    }
    if (!config.dataPath.empty() && !fs::is_directory(config.dataPath, ec)) {
      report.issues.push_back("Node \"" + name +
                              "\": data directory is missing: " +
                              config.dataPath);
    }
    if (!config.configPath.empty()) {
      // <node>/config/elasticsearch.yml
      knownDirs.insert(normalizedPath(
          fs::path(config.configPath).parent_path().parent_path().string()));
    }
  }

  if (fs::is_directory(nodesRoot, ec)) {
    for (const auto &entry : fs::directory_iterator(nodesRoot, ec)) {
      if (!entry.is_directory(ec)) continue;
      const auto dir = normalizedPath(entry.path().string());
      if (!knownDirs.count(dir)) {
        report.issues.push_back("Directory without registry record: " + dir);
      }
    }
  }

  report.valid = report.issues.empty();
  return report;
}
