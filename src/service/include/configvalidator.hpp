/**
 * @file configvalidator.hpp
 * @date October 2026
 * @brief Структурная проверка файла конфигурации NodeSteward
 */

#pragma once

#include <nlohmann/json.hpp>

/**
 * @class ConfigValidator
 * @brief Проверяет наличие секций и типы полей
 *
 * @details
 * Все методы возвращают true либо бросают std::runtime_error с префиксом
 * "ConfigValidator:" и описанием первого найденного нарушения.
 */
class ConfigValidator {
 public:
  /// Корень: объекты "defaults" и "environments", defaults не пуст
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Секция "orchestrator" объединённой конфигурации
   *
   * @details
   * Проверяются типы известных ключей, диапазоны портов и счётчиков,
   * значение role_policy и heap_limit_ratio в (0, 1].
   */
  bool validateOrchestrator(const nlohmann::json &section) const;

  /// Массив "logging": type из {console, sync_file}, file для sync_file
  bool validateLogging(const nlohmann::json &logging) const;

  /// Полная проверка объединённой конфигурации окружения
  bool validateMerged(const nlohmann::json &merged) const;

 private:
  void requireType(const nlohmann::json &section, const char *key,
                   nlohmann::json::value_t type) const;
  void requirePositive(const nlohmann::json &section, const char *key) const;
};
