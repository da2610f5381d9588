#include "../include/nodeinvariants.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::string normalizedPath(const std::string &path) {
  if (path.empty()) return path;
  auto normal = fs::path(path).lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') normal.pop_back();
  return normal;
}

std::set<int> collectPorts(const std::vector<NodeConfig> &nodes) {
  std::set<int> ports;
  for (const auto &node : nodes) {
    ports.insert(node.httpPort);
    ports.insert(node.transportPort);
  }
  return ports;
}

void scanUniquenessConflicts(const NodeConfig &candidate,
                             const std::vector<NodeConfig> &others,
                             ValidationResult &result) {
  const auto dataPath = normalizedPath(candidate.dataPath);
  const auto logsPath = normalizedPath(candidate.logsPath);

  if (candidate.httpPort == candidate.transportPort) {
    result.addConflict(ConflictType::TransportPort,
                       "Transport port " +
                           std::to_string(candidate.transportPort) +
                           " must differ from HTTP port");
  }

  for (const auto &other : others) {
    const std::string owner = "\"" + other.name + "\"";

    if (other.name == candidate.name) {
      result.addConflict(ConflictType::NodeName,
                         "Node name \"" + candidate.name + "\" already exists",
                         other.name);
    }

    if (candidate.httpPort == other.httpPort ||
        candidate.httpPort == other.transportPort) {
      result.addConflict(ConflictType::HttpPort,
                         "HTTP port " + std::to_string(candidate.httpPort) +
                             " is already used by node " + owner,
                         other.name);
    }

    if (candidate.transportPort == other.transportPort ||
        candidate.transportPort == other.httpPort) {
      result.addConflict(ConflictType::TransportPort,
                         "Transport port " +
                             std::to_string(candidate.transportPort) +
                             " is already used by node " + owner,
                         other.name);
    }

    if (!dataPath.empty() && dataPath == normalizedPath(other.dataPath)) {
      result.addConflict(ConflictType::DataPath,
                         "Data path \"" + candidate.dataPath +
                             "\" is already used by node " + owner,
                         other.name);
    }

    if (!logsPath.empty() && logsPath == normalizedPath(other.logsPath)) {
      result.addConflict(ConflictType::LogsPath,
                         "Logs path \"" + candidate.logsPath +
                             "\" is already used by node " + owner,
                         other.name);
    }
  }
}
