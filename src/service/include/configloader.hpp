/**
 * @file configloader.hpp
 * @date October 2026
 * @brief Чтение JSON-документов с диска
 *
 * @details
 * Используется ConfigManager для файла конфигурации и NodeRegistry для
 * файла реестра. Ошибки открытия и синтаксиса сводятся к
 * std::runtime_error с указанием файла и позиции.
 */

#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ConfigLoader
 * @brief Загрузчик JSON-файлов
 *
 * @note Не потокобезопасен; владелец обеспечивает синхронизацию
 */
class ConfigLoader {
 public:
  ConfigLoader() = default;

  /**
   * @brief Загружает документ и запоминает путь для reload()
   * @throw std::runtime_error Файл недоступен или содержит неверный JSON
   */
  nlohmann::json loadFromFile(const std::string &filename);

  /**
   * @brief Повторно читает последний загруженный файл
   * @throw std::runtime_error Файл ещё не загружался или недоступен
   */
  nlohmann::json reload() const;

  std::string getLastLoadedFile() const;
  bool hasLoadedFile() const;

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile_;
};
