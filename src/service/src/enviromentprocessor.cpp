#include "../include/enviromentprocessor.hpp"

#include <cstdlib>
#include <cstring>

void EnvironmentProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](std::string &value) { resolveVariable(value); });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node,
    const std::function<void(std::string &)> &func) const {
  if (node.is_object() || node.is_array()) {
    for (auto &child : node) {
      walkJson(child, func);
    }
  } else if (node.is_string()) {
    std::string text = node.get<std::string>();
    func(text);
    node = text;
  }
}

void EnvironmentProcessor::resolveVariable(std::string &value) const {
  static const std::string prefix = "$ENV{";
  size_t pos = 0;

  while ((pos = value.find(prefix, pos)) != std::string::npos) {
    const size_t nameBegin = pos + prefix.length();
    const size_t close = value.find('}', nameBegin);
    if (close == std::string::npos) break;

    const std::string name = value.substr(nameBegin, close - nameBegin);
    if (const char *env = std::getenv(name.c_str())) {
      value.replace(pos, close - pos + 1, env);
      pos += std::strlen(env);
    } else {
      pos = close + 1;
    }
  }
}
