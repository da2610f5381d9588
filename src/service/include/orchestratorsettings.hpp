/**
 * @file orchestratorsettings.hpp
 * @date October 2026
 * @brief Типизированное представление секции "orchestrator"
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @enum RolePolicy
 * @brief Реакция на узел без единой роли
 */
enum class RolePolicy { Allow, Warn, Reject };

RolePolicy rolePolicyFromString(const std::string &value);
std::string rolePolicyToString(RolePolicy policy);

/**
 * @struct ReconcilePolicy
 * @brief Бюджет опроса для одного направления перехода
 */
struct ReconcilePolicy {
  int attempts;
  std::chrono::milliseconds interval;
};

/**
 * @struct ValidatorPolicy
 * @brief Параметры проверки и поиска подсказок
 */
struct ValidatorPolicy {
  double heapLimitRatio = 0.75;
  int httpPortBase = 9200;
  int transportPortBase = 9300;
  int portSearchWindow = 1000;
  int maxNameSuggestions = 5;
  int nameSearchLimit = 100;
  RolePolicy rolePolicy = RolePolicy::Warn;
};

struct OrchestratorSettings {
  std::string basePath = "./nodes-root";
  std::string registryFile;  ///< Пусто: <basePath>/registry.json
  std::string engineExecutable = "/usr/share/elasticsearch/bin/elasticsearch";

  ValidatorPolicy validator;

  ReconcilePolicy start{20, std::chrono::milliseconds(3000)};
  ReconcilePolicy stop{10, std::chrono::milliseconds(2000)};

  std::chrono::milliseconds validationTimeout{5000};
  bool allowCopyWhileRunning = false;
  bool probePort = true;

  /**
   * @brief Строит настройки из объединённой конфигурации окружения
   *
   * @details
   * Отсутствующая секция или ключ дают значения по умолчанию. Типы
   * проверяются заранее в ConfigValidator::validateOrchestrator().
   */
  static OrchestratorSettings fromConfig(const nlohmann::json &merged);

  std::string resolvedRegistryFile() const;
};
