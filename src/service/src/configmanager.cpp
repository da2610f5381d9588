#include "../include/configmanager.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

#include "steward/compositelogger.hpp"

namespace {

nlohmann::json parseOverrideValue(const std::string &raw) {
  try {
    auto value = nlohmann::json::parse(raw);
    if (value.is_primitive()) return value;
  } catch (const nlohmann::json::parse_error &) {
    // обычная строка
  }
  return raw;
}

}  // namespace

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

nlohmann::json ConfigManager::prepare(nlohmann::json config) const {
  envProcessor_.process(config);
  validator_.validateRoot(config);
  return config;
}

void ConfigManager::initialize(const std::string &filename) {
  std::lock_guard lock(configMutex_);

  try {
    baseConfig_ = prepare(loader_.loadFromFile(filename));
    overrides_ = nlohmann::json::object();
    fromFile_ = true;
  } catch (const std::exception &e) {
    throw std::runtime_error(
        std::string("ConfigManager: Config initialization failed: ") +
        e.what());
  }
}

void ConfigManager::initializeFromJson(nlohmann::json config) {
  std::lock_guard lock(configMutex_);

  try {
    baseConfig_ = prepare(std::move(config));
    overrides_ = nlohmann::json::object();
    fromFile_ = false;
  } catch (const std::exception &e) {
    throw std::runtime_error(
        std::string("ConfigManager: Config initialization failed: ") +
        e.what());
  }
}

void ConfigManager::reload() {
  std::lock_guard lock(configMutex_);

  if (!fromFile_) {
    throw std::runtime_error(
        "ConfigManager: No configuration file available for reload");
  }

  try {
    baseConfig_ = prepare(loader_.reload());
    steward::CompositeLogger::instance().info(
        "ConfigManager: Configuration reloaded from " +
        loader_.getLastLoadedFile());
  } catch (const std::exception &e) {
    steward::CompositeLogger::instance().warning(
        "ConfigManager: Reload failed, keeping previous configuration: " +
        std::string(e.what()));
    throw std::runtime_error("ConfigManager: Config reload failed: " +
                             std::string(e.what()));
  }
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  std::lock_guard lock(configMutex_);

  if (baseConfig_.is_null()) {
    throw std::runtime_error("ConfigManager: Configuration is not initialized");
  }
  if (!baseConfig_["environments"].contains(env)) {
    throw std::runtime_error("ConfigManager: Environment '" + env +
                             "' not found");
  }

  nlohmann::json merged = baseConfig_["defaults"];
  merged.merge_patch(baseConfig_["environments"][env]);
  merged.merge_patch(overrides_);
  validator_.validateMerged(merged);
  return merged;
}

void ConfigManager::applyCliOverrides(
    const std::unordered_map<std::string, std::string> &overrides) {
  std::lock_guard lock(configMutex_);

  nlohmann::json patch = nlohmann::json::object();
  for (const auto &[key, value] : overrides) {
    nlohmann::json *node = &patch;
    std::stringstream path(key);
    std::string part;
    std::vector<std::string> parts;
    while (std::getline(path, part, '.')) parts.push_back(part);
    if (parts.empty()) continue;

    for (size_t i = 0; i + 1 < parts.size(); ++i) {
      node = &(*node)[parts[i]];
    }
    (*node)[parts.back()] = parseOverrideValue(value);
  }

  overrides_.merge_patch(patch);
}

nlohmann::json ConfigManager::getCurrentConfig() const {
  std::lock_guard lock(configMutex_);
  return baseConfig_;
}

bool ConfigManager::isInitialized() const {
  std::lock_guard lock(configMutex_);
  return !baseConfig_.is_null();
}
