#include "../include/validationresult.hpp"

std::string conflictTypeToString(ConflictType type) {
  switch (type) {
    case ConflictType::NodeName:
      return "node_name";
    case ConflictType::HttpPort:
      return "http_port";
    case ConflictType::TransportPort:
      return "transport_port";
    case ConflictType::DataPath:
      return "data_path";
    case ConflictType::LogsPath:
      return "logs_path";
    case ConflictType::HeapSize:
      return "heap_size";
    case ConflictType::NodeRoles:
      return "node_roles";
  }
  return "unknown";
}

nlohmann::json Conflict::toJson() const {
  nlohmann::json out = {{"type", conflictTypeToString(type)},
                        {"message", message}};
  if (!conflictWith.empty()) out["conflictWith"] = conflictWith;
  return out;
}

nlohmann::json Suggestions::toJson() const {
  nlohmann::json out = nlohmann::json::object();
  if (httpPort) out["httpPort"] = *httpPort;
  if (transportPort) out["transportPort"] = *transportPort;
  if (!nodeName.empty()) out["nodeName"] = nodeName;
  return out;
}

std::string ValidationResult::summary() const {
  std::string out;
  for (const auto &c : conflicts) {
    if (!out.empty()) out += "; ";
    out += c.message;
  }
  return out;
}

nlohmann::json ValidationResult::toJson() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &c : conflicts) list.push_back(c.toJson());
  return {{"valid", valid},
          {"conflicts", list},
          {"suggestions", suggestions.toJson()},
          {"warnings", warnings}};
}
