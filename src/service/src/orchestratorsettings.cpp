#include "../include/orchestratorsettings.hpp"

#include <filesystem>
#include <stdexcept>

RolePolicy rolePolicyFromString(const std::string &value) {
  if (value == "allow") return RolePolicy::Allow;
  if (value == "warn") return RolePolicy::Warn;
  if (value == "reject") return RolePolicy::Reject;
  throw std::invalid_argument("OrchestratorSettings: Unknown role policy: " +
                              value);
}

std::string rolePolicyToString(RolePolicy policy) {
  switch (policy) {
    case RolePolicy::Allow:
      return "allow";
    case RolePolicy::Warn:
      return "warn";
    case RolePolicy::Reject:
      return "reject";
  }
  return "warn";
}

OrchestratorSettings OrchestratorSettings::fromConfig(
    const nlohmann::json &merged) {
  OrchestratorSettings s;
  if (!merged.contains("orchestrator")) return s;

  const auto &o = merged["orchestrator"];
  s.basePath = o.value("base_path", s.basePath);
  s.registryFile = o.value("registry_file", s.registryFile);
  s.engineExecutable = o.value("engine_executable", s.engineExecutable);

  auto &v = s.validator;
  v.heapLimitRatio = o.value("heap_limit_ratio", v.heapLimitRatio);
  v.httpPortBase = o.value("http_port_base", v.httpPortBase);
  v.transportPortBase = o.value("transport_port_base", v.transportPortBase);
  v.portSearchWindow = o.value("port_search_window", v.portSearchWindow);
  v.maxNameSuggestions = o.value("max_name_suggestions", v.maxNameSuggestions);
  v.nameSearchLimit = o.value("name_search_limit", v.nameSearchLimit);
  if (o.contains("role_policy")) {
    v.rolePolicy = rolePolicyFromString(o["role_policy"].get<std::string>());
  }

  s.start.attempts = o.value("start_attempts", s.start.attempts);
  s.start.interval = std::chrono::milliseconds(
      o.value("start_interval_ms", static_cast<long long>(s.start.interval.count())));
  s.stop.attempts = o.value("stop_attempts", s.stop.attempts);
  s.stop.interval = std::chrono::milliseconds(
      o.value("stop_interval_ms", static_cast<long long>(s.stop.interval.count())));

  s.validationTimeout = std::chrono::milliseconds(o.value(
      "validation_timeout_ms",
      static_cast<long long>(s.validationTimeout.count())));
  s.allowCopyWhileRunning =
      o.value("allow_copy_while_running", s.allowCopyWhileRunning);
  s.probePort = o.value("probe_port", s.probePort);
  return s;
}

std::string OrchestratorSettings::resolvedRegistryFile() const {
  if (!registryFile.empty()) return registryFile;
  return (std::filesystem::path(basePath) / "registry.json").string();
}
