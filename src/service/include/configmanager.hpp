/**
 * @file configmanager.hpp
 * @date October 2026
 * @brief Центральный менеджер конфигурации NodeSteward
 *
 * @details
 * Файл конфигурации содержит секцию "defaults" и секцию "environments" с
 * именованными окружениями. Для выбранного окружения итоговая конфигурация
 * строится наложением (JSON merge-patch) секции окружения на defaults.
 *
 * Порядок обработки при загрузке:
 * 1. Чтение файла (ConfigLoader)
 * 2. Подстановка `$ENV{VAR}` (EnvironmentProcessor)
 * 3. Проверка корня (ConfigValidator::validateRoot)
 *
 * @code
 auto &mgr = ConfigManager::instance();
 mgr.initialize("nodesteward.json");
 mgr.applyCliOverrides({{"orchestrator.start_attempts", "5"}});
 auto merged = mgr.getMergedConfig("production");
 @endcode
 */

#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/enviromentprocessor.hpp"

/**
 * @class ConfigManager
 * @brief Потокобезопасный синглтон доступа к конфигурации
 */
class ConfigManager {
 public:
  static ConfigManager &instance();

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  /**
   * @brief Загружает файл конфигурации и сбрасывает прежние overrides
   * @throw std::runtime_error Ошибка чтения, разбора или структуры
   */
  void initialize(const std::string &filename);

  /**
   * @brief Устанавливает конфигурацию из готового документа
   *
   * @details
   * Документ проходит ту же обработку, что и содержимое файла. reload()
   * после этого недоступен.
   */
  void initializeFromJson(nlohmann::json config);

  /**
   * @brief Перечитывает файл; при ошибке сохраняется прежняя конфигурация
   * @throw std::runtime_error Если перезагрузка не удалась
   */
  void reload();

  /**
   * @brief Итоговая конфигурация окружения
   * @throw std::runtime_error Окружение не найдено или не прошло проверку
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /**
   * @brief Накладывает параметры командной строки поверх окружения
   *
   * @details
   * Ключ с точками ("orchestrator.base_path") задаёт путь во вложенных
   * объектах. Значение разбирается как JSON-литерал (число, true/false),
   * иначе сохраняется строкой.
   */
  void applyCliOverrides(
      const std::unordered_map<std::string, std::string> &overrides);

  nlohmann::json getCurrentConfig() const;
  bool isInitialized() const;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;

  nlohmann::json prepare(nlohmann::json config) const;

  ConfigLoader loader_;
  ConfigValidator validator_;
  EnvironmentProcessor envProcessor_;

  nlohmann::json baseConfig_;
  nlohmann::json overrides_ = nlohmann::json::object();
  bool fromFile_ = false;

  mutable std::mutex configMutex_;
};
