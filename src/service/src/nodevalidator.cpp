#include "../include/nodevalidator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "../include/errors.hpp"
#include "../include/nodeinvariants.hpp"

namespace {

constexpr double kBytesPerGigabyte = 1024.0 * 1024.0 * 1024.0;

std::string formatGigabytes(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value << " GB";
  return out.str();
}

}  // namespace

NodeValidator::NodeValidator(const ISystemMemoryReporter &memory,
                             ValidatorPolicy policy)
    : memory_(memory), policy_(policy) {}

ValidationResult NodeValidator::validate(
    const NodeConfig &candidate, ValidationMode mode,
    const std::vector<NodeConfig> &snapshot,
    const std::optional<std::string> &originalName) const {
  std::vector<NodeConfig> others;
  others.reserve(snapshot.size());
  for (const auto &node : snapshot) {
    if (mode == ValidationMode::Update && originalName &&
        node.name == *originalName) {
      continue;
    }
    others.push_back(node);
  }

  ValidationResult result;
  scanUniquenessConflicts(candidate, others, result);
  checkHeap(candidate, result);
  checkRoles(candidate, result);

  const bool httpConflict = result.hasConflict(ConflictType::HttpPort);
  const bool transportConflict =
      result.hasConflict(ConflictType::TransportPort);

  if (httpConflict || transportConflict) {
    const std::set<int> taken = collectPorts(others);

    int http = candidate.httpPort;
    if (httpConflict) {
      auto used = taken;
      used.insert(candidate.transportPort);
      http = findFreePort(candidate.httpPort, used);
      result.suggestions.httpPort = http;
    }
    if (transportConflict) {
      auto used = taken;
      used.insert(http);
      result.suggestions.transportPort =
          findFreePort(candidate.transportPort, used);
    }
  }

  if (result.hasConflict(ConflictType::NodeName)) {
    std::set<std::string> names;
    for (const auto &node : others) names.insert(node.name);
    result.suggestions.nodeName = suggestNames(candidate.name, names);
  }

  return result;
}

int NodeValidator::findFreePort(int start, const std::set<int> &used) const {
  const auto limit = static_cast<int>(std::min<long long>(
      65535, static_cast<long long>(start) + policy_.portSearchWindow));
  for (int port = std::max(start, 1); port <= limit; ++port) {
    if (!used.count(port)) return port;
  }
  throw ResourceExhaustionError("NodeValidator: No free port in range " +
                                std::to_string(start) + ".." +
                                std::to_string(limit));
}

std::vector<std::string> NodeValidator::suggestNames(
    const std::string &base, const std::set<std::string> &taken) const {
  std::vector<std::string> names;
  for (long long i = 2; i < 2LL + policy_.nameSearchLimit; ++i) {
    std::string name = base + "-" + std::to_string(i);
    if (taken.count(name)) continue;
    names.push_back(std::move(name));
    if (static_cast<int>(names.size()) >= policy_.maxNameSuggestions) break;
  }
  if (names.empty()) {
    throw ResourceExhaustionError("NodeValidator: No free name derived from \"" +
                                  base + "\"");
  }
  return names;
}

void NodeValidator::checkHeap(const NodeConfig &candidate,
                              ValidationResult &result) const {
  const auto heap = HeapSize::parse(candidate.heapSize);
  if (!heap) {
    result.addConflict(ConflictType::HeapSize,
                       "Invalid heap size format \"" + candidate.heapSize +
                           "\". Use a number with k, m, g or t suffix, e.g. 1g");
    return;
  }

  const double totalGb =
      static_cast<double>(memory_.totalMemoryBytes()) / kBytesPerGigabyte;
  const double limitGb = totalGb * policy_.heapLimitRatio;
  if (heap->toGigabytes() > limitGb) {
    std::ostringstream percent;
    percent << policy_.heapLimitRatio * 100.0;
    result.addConflict(ConflictType::HeapSize,
                       "Heap size " + candidate.heapSize + " exceeds " +
                           percent.str() + "% of system memory (" +
                           formatGigabytes(limitGb) + " of " +
                           formatGigabytes(totalGb) + ")");
  }
}

void NodeValidator::checkRoles(const NodeConfig &candidate,
                               ValidationResult &result) const {
  if (!candidate.roles.none()) return;

  const std::string message =
      "Node \"" + candidate.name + "\" has no roles enabled";
  switch (policy_.rolePolicy) {
    case RolePolicy::Allow:
      break;
    case RolePolicy::Warn:
      result.warnings.push_back(message);
      break;
    case RolePolicy::Reject:
      result.addConflict(ConflictType::NodeRoles, message);
      break;
  }
}
