/**
 * @file validationresult.hpp
 * @date October 2026
 * @brief Результат проверки конфигурации узла
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @enum ConflictType
 * @brief Поле, по которому обнаружен конфликт
 */
enum class ConflictType {
  NodeName,
  HttpPort,
  TransportPort,
  DataPath,
  LogsPath,
  HeapSize,
  NodeRoles
};

/// Строковая метка типа ("node_name", "http_port", ...)
std::string conflictTypeToString(ConflictType type);

/**
 * @struct Conflict
 * @brief Одно нарушение с указанием узла-владельца ресурса
 */
struct Conflict {
  ConflictType type;
  std::string message;
  std::string conflictWith;  ///< Пусто для внутренних нарушений кандидата

  nlohmann::json toJson() const;
};

/**
 * @struct Suggestions
 * @brief Предлагаемые замены для конфликтующих полей
 */
struct Suggestions {
  std::optional<int> httpPort;
  std::optional<int> transportPort;
  std::vector<std::string> nodeName;

  bool empty() const {
    return !httpPort && !transportPort && nodeName.empty();
  }
  nlohmann::json toJson() const;
};

/**
 * @struct ValidationResult
 * @brief Итог проверки: valid == conflicts.empty()
 */
struct ValidationResult {
  bool valid = true;
  std::vector<Conflict> conflicts;
  Suggestions suggestions;
  std::vector<std::string> warnings;

  void addConflict(ConflictType type, std::string message,
                   std::string conflictWith = {}) {
    conflicts.push_back({type, std::move(message), std::move(conflictWith)});
    valid = false;
  }

  bool hasConflict(ConflictType type) const {
    for (const auto &c : conflicts) {
      if (c.type == type) return true;
    }
    return false;
  }

  /// Сообщения всех конфликтов через "; "
  std::string summary() const;

  nlohmann::json toJson() const;
};
