/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора структуры JSON-конфигурации
 */
#include "../include/configvalidator.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace std;

namespace {

bool sameKind(const nlohmann::json &value, nlohmann::json::value_t type) {
  using vt = nlohmann::json::value_t;
  switch (type) {
    case vt::number_unsigned:
    case vt::number_integer:
      return value.is_number_integer();
    case vt::number_float:
      return value.is_number();
    case vt::string:
      return value.is_string();
    case vt::boolean:
      return value.is_boolean();
    default:
      return value.type() == type;
  }
}

}  // namespace

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  const vector<string> required_sections = {"defaults", "environments"};

  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Root must be an object");
  }

  for (const auto &section : required_sections) {
    if (!config.contains(section) || !config[section].is_object()) {
      throw runtime_error("ConfigValidator: Missing required section: " +
                          section);
    }
  }

  if (config["defaults"].empty()) {
    throw runtime_error("ConfigValidator: Defaults section cannot be empty");
  }

  return true;
}

void ConfigValidator::requireType(const nlohmann::json &section,
                                  const char *key,
                                  nlohmann::json::value_t type) const {
  if (section.contains(key) && !sameKind(section[key], type)) {
    throw runtime_error(string("ConfigValidator: Invalid type of orchestrator.") +
                        key);
  }
}

void ConfigValidator::requirePositive(const nlohmann::json &section,
                                      const char *key) const {
  requireType(section, key, nlohmann::json::value_t::number_integer);
  if (section.contains(key) && section[key].get<long long>() <= 0) {
    throw runtime_error(string("ConfigValidator: orchestrator.") + key +
                        " must be positive");
  }
}

bool ConfigValidator::validateOrchestrator(const nlohmann::json &section) const {
  using vt = nlohmann::json::value_t;

  if (!section.is_object()) {
    throw runtime_error("ConfigValidator: Orchestrator section must be an object");
  }

  for (const char *key : {"base_path", "registry_file", "engine_executable",
                          "role_policy"}) {
    requireType(section, key, vt::string);
  }
  for (const char *key : {"allow_copy_while_running", "probe_port"}) {
    requireType(section, key, vt::boolean);
  }
  for (const char *key :
       {"port_search_window", "max_name_suggestions", "name_search_limit",
        "start_attempts", "start_interval_ms", "stop_attempts",
        "stop_interval_ms", "validation_timeout_ms"}) {
    requirePositive(section, key);
  }

  for (const char *key : {"http_port_base", "transport_port_base"}) {
    requirePositive(section, key);
    if (section.contains(key) && section[key].get<long long>() > 65535) {
      throw runtime_error(string("ConfigValidator: orchestrator.") + key +
                          " exceeds 65535");
    }
  }

  requireType(section, "heap_limit_ratio", vt::number_float);
  if (section.contains("heap_limit_ratio")) {
    const double ratio = section["heap_limit_ratio"].get<double>();
    if (ratio <= 0.0 || ratio > 1.0) {
      throw runtime_error(
          "ConfigValidator: orchestrator.heap_limit_ratio must be in (0, 1]");
    }
  }

  if (section.contains("role_policy")) {
    const vector<string> policies = {"allow", "warn", "reject"};
    const string policy = section["role_policy"].get<string>();
    if (find(policies.begin(), policies.end(), policy) == policies.end()) {
      throw runtime_error("ConfigValidator: Invalid role_policy: " + policy);
    }
  }
  return true;
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: Logging config must be an array");
  }

  const vector<string> valid_types = {"console", "sync_file"};

  for (const auto &logger : logging) {
    if (!logger.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    if (!logger.contains("type") || !logger["type"].is_string()) {
      throw runtime_error("ConfigValidator: Logger missing type field");
    }

    const string type = logger["type"].get<string>();
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (logger.contains("level") && !logger["level"].is_string()) {
      throw runtime_error("ConfigValidator: Invalid log level type");
    }

    if (type == "sync_file" &&
        (!logger.contains("file") || !logger["file"].is_string())) {
      throw runtime_error("ConfigValidator: File logger missing file path");
    }
  }
  return true;
}

bool ConfigValidator::validateMerged(const nlohmann::json &merged) const {
  if (merged.contains("orchestrator")) {
    validateOrchestrator(merged["orchestrator"]);
  }
  if (merged.contains("logging")) {
    validateLogging(merged["logging"]);
  }
  return true;
}
