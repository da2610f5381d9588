/**
 * @file nodeconfig.cpp
 * @brief Реализация разбора конфигурации узла
 */

#include "../include/nodeconfig.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

void applyRole(NodeRoles &roles, const std::string &role) {
  if (role == "master") {
    roles.master = true;
  } else if (role == "data") {
    roles.data = true;
  } else if (role == "ingest") {
    roles.ingest = true;
  } else if (!role.empty()) {
    throw std::invalid_argument("NodeRoles: Unknown role: " + role);
  }
}

std::string requireString(const nlohmann::json &src, const char *field) {
  if (!src[field].is_string()) {
    throw std::invalid_argument(std::string("NodeConfig: Field '") + field +
                                "' must be a string");
  }
  return src[field].get<std::string>();
}

}  // namespace

std::string NodeRoles::toList() const {
  std::vector<std::string> list;
  if (master) list.emplace_back("master");
  if (data) list.emplace_back("data");
  if (ingest) list.emplace_back("ingest");

  std::ostringstream out;
  for (size_t i = 0; i < list.size(); ++i) {
    if (i) out << ", ";
    out << list[i];
  }
  return out.str();
}

NodeRoles NodeRoles::fromJson(const nlohmann::json &value) {
  NodeRoles roles{false, false, false};

  if (value.is_object()) {
    roles.master = value.value("master", false);
    roles.data = value.value("data", false);
    roles.ingest = value.value("ingest", false);
  } else if (value.is_array()) {
    for (const auto &role : value) {
      if (!role.is_string()) {
        throw std::invalid_argument("NodeRoles: Role entries must be strings");
      }
      applyRole(roles, trim(role.get<std::string>()));
    }
  } else if (value.is_string()) {
    std::string list = value.get<std::string>();
    list.erase(std::remove(list.begin(), list.end(), '['), list.end());
    list.erase(std::remove(list.begin(), list.end(), ']'), list.end());
    std::stringstream ss(list);
    std::string role;
    while (std::getline(ss, role, ',')) {
      applyRole(roles, trim(role));
    }
  } else {
    throw std::invalid_argument("NodeRoles: Unsupported roles format");
  }
  return roles;
}

nlohmann::json NodeRoles::toJson() const {
  return {{"master", master}, {"data", data}, {"ingest", ingest}};
}

std::optional<HeapSize> HeapSize::parse(const std::string &text) {
  static const std::regex pattern("^([0-9]+)([kmgt])$", std::regex::icase);

  std::smatch match;
  if (!std::regex_match(text, match, pattern)) {
    return std::nullopt;
  }

  HeapSize heap;
  try {
    heap.amount = std::stoull(match[1].str());
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
  heap.unit = static_cast<char>(
      std::tolower(static_cast<unsigned char>(match[2].str()[0])));
  return heap;
}

double HeapSize::toGigabytes() const {
  const double value = static_cast<double>(amount);
  switch (unit) {
    case 'k':
      return value / (1024.0 * 1024.0);
    case 'm':
      return value / 1024.0;
    case 't':
      return value * 1024.0;
    case 'g':
    default:
      return value;
  }
}

int parsePort(const nlohmann::json &value, const std::string &field) {
  long long port = 0;
  if (value.is_number_integer()) {
    port = value.get<long long>();
  } else if (value.is_string()) {
    const std::string text = value.get<std::string>();
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      throw std::invalid_argument("NodeConfig: Field '" + field +
                                  "' is not a number: " + text);
    }
    try {
      port = std::stoll(text);
    } catch (const std::out_of_range &) {
      throw std::invalid_argument("NodeConfig: Field '" + field +
                                  "' is out of range: " + text);
    }
  } else {
    throw std::invalid_argument("NodeConfig: Field '" + field +
                                "' must be an integer");
  }

  if (port < 1 || port > 65535) {
    throw std::invalid_argument("NodeConfig: Field '" + field +
                                "' must be in range 1..65535, got " +
                                std::to_string(port));
  }
  return static_cast<int>(port);
}

NodeConfig NodeConfig::fromJson(const nlohmann::json &src) {
  if (!src.is_object()) {
    throw std::invalid_argument("NodeConfig: Node configuration must be an object");
  }
  if (!src.contains("name")) {
    throw std::invalid_argument("NodeConfig: Missing required field 'name'");
  }

  NodeConfig config;
  config.name = requireString(src, "name");
  if (config.name.empty()) {
    throw std::invalid_argument("NodeConfig: Node name must not be empty");
  }
  return config.merged(src);
}

NodeConfig NodeConfig::merged(const nlohmann::json &patch) const {
  if (!patch.is_object()) {
    throw std::invalid_argument("NodeConfig: Update must be an object");
  }

  NodeConfig config = *this;

  if (patch.contains("name")) {
    config.name = requireString(patch, "name");
    if (config.name.empty()) {
      throw std::invalid_argument("NodeConfig: Node name must not be empty");
    }
  }
  if (patch.contains("host")) config.host = requireString(patch, "host");

  if (patch.contains("httpPort")) {
    config.httpPort = parsePort(patch["httpPort"], "httpPort");
  } else if (patch.contains("port")) {
    config.httpPort = parsePort(patch["port"], "port");
  }
  if (patch.contains("transportPort")) {
    config.transportPort = parsePort(patch["transportPort"], "transportPort");
  }

  if (patch.contains("cluster")) {
    config.cluster = requireString(patch, "cluster");
  } else if (patch.contains("clusterName")) {
    config.cluster = requireString(patch, "clusterName");
  }
  if (config.cluster.empty()) config.cluster = kDefaultCluster;

  if (patch.contains("dataPath")) config.dataPath = requireString(patch, "dataPath");
  if (patch.contains("logsPath")) config.logsPath = requireString(patch, "logsPath");
  if (patch.contains("configPath")) {
    config.configPath = requireString(patch, "configPath");
  }
  if (patch.contains("roles")) config.roles = NodeRoles::fromJson(patch["roles"]);
  if (patch.contains("heapSize")) {
    config.heapSize = requireString(patch, "heapSize");
  }

  return config;
}

nlohmann::json NodeConfig::toJson() const {
  return {{"name", name},
          {"host", host},
          {"httpPort", httpPort},
          {"transportPort", transportPort},
          {"cluster", cluster},
          {"dataPath", dataPath},
          {"logsPath", logsPath},
          {"configPath", configPath},
          {"roles", roles.toJson()},
          {"heapSize", heapSize},
          {"nodeUrl", nodeUrl()}};
}

std::string NodeConfig::nodeUrl() const {
  return "http://" + host + ":" + std::to_string(httpPort);
}
