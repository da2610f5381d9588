/**
 * @file nodeconfig.hpp
 * @date October 2026
 * @brief Конфигурация узла поискового движка и разбор размера кучи
 *
 * @details
 * Структура **NodeConfig** описывает один узел: имя, сетевые параметры,
 * каталоги данных и журналов, роли и размер кучи JVM. Экземпляр хранится в
 * NodeRegistry; наблюдаемое состояние процесса (isRunning) в ней не
 * хранится и определяется через NodeReconciler.
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/// Значения по умолчанию для узлов, заданных неполной конфигурацией
inline constexpr const char *kDefaultHost = "localhost";
inline constexpr const char *kDefaultCluster = "trustquery-cluster";
inline constexpr const char *kDefaultHeapSize = "1g";
inline constexpr int kDefaultHttpPort = 9200;
inline constexpr int kDefaultTransportPort = 9300;

/**
 * @struct NodeRoles
 * @brief Набор независимых ролей узла
 */
struct NodeRoles {
  bool master = true;
  bool data = true;
  bool ingest = true;

  bool none() const { return !master && !data && !ingest; }

  /// "master, data, ingest" в порядке объявления, только включённые роли
  std::string toList() const;

  /**
   * @brief Разбирает роли из объекта {master,data,ingest}, массива строк
   * или строки через запятую
   * @throw std::invalid_argument Неизвестный формат или имя роли
   */
  static NodeRoles fromJson(const nlohmann::json &value);
  nlohmann::json toJson() const;

  bool operator==(const NodeRoles &other) const {
    return master == other.master && data == other.data &&
           ingest == other.ingest;
  }
  bool operator!=(const NodeRoles &other) const { return !(*this == other); }
};

/**
 * @struct HeapSize
 * @brief Размер кучи вида "<число><k|m|g|t>"
 */
struct HeapSize {
  std::uint64_t amount = 0;
  char unit = 'g';  ///< Всегда в нижнем регистре

  /**
   * @brief Разбирает строку по шаблону ^[0-9]+[kmgt]$ без учёта регистра
   * @return std::nullopt при несоответствии формату
   */
  static std::optional<HeapSize> parse(const std::string &text);

  /// Значение в гигабайтах с точным двоичным масштабом
  double toGigabytes() const;
};

/**
 * @struct NodeConfig
 * @brief Запись реестра об одном узле
 */
struct NodeConfig {
  std::string name;
  std::string host = kDefaultHost;
  int httpPort = kDefaultHttpPort;
  int transportPort = kDefaultTransportPort;
  std::string cluster = kDefaultCluster;
  std::string dataPath;
  std::string logsPath;
  std::string configPath;  ///< Путь к сгенерированному elasticsearch.yml
  NodeRoles roles;
  std::string heapSize = kDefaultHeapSize;

  /**
   * @brief Строит конфигурацию из JSON-запроса или записи реестра
   *
   * @details
   * Принимает как ключи реестра ("httpPort"), так и ключи исходного API
   * ("port", "clusterName"). Отсутствующие поля получают значения по
   * умолчанию. Порты допускаются числом или строкой из цифр.
   *
   * @throw std::invalid_argument Отсутствует имя, порт вне 1..65535 или
   * неверный тип поля
   */
  static NodeConfig fromJson(const nlohmann::json &src);

  nlohmann::json toJson() const;

  /**
   * @brief Применяет частичное обновление поверх текущих значений
   * @throw std::invalid_argument Аналогично fromJson()
   */
  NodeConfig merged(const nlohmann::json &patch) const;

  std::string nodeUrl() const;
};

/// Разбор номера порта из числа или строки. Бросает std::invalid_argument.
int parsePort(const nlohmann::json &value, const std::string &field);
