/**
 * @file noderegistry.hpp
 * @date October 2026
 * @brief Долговременное хранилище записей об узлах
 *
 * @details
 * Реестр является единственным владельцем NodeConfig. Чтения выполняются
 * под разделяемой блокировкой и возвращают копии (снимки), мутации под
 * эксклюзивной. Перед каждой вставкой или заменой инварианты уникальности
 * проверяются повторно, поэтому два параллельных создания с разными
 * именами и одинаковым портом не могут оба попасть в реестр.
 *
 * При заданном файле состояние сохраняется после каждой мутации
 * (временный файл + rename). Если запись не удалась, изменение в памяти
 * отменяется и выбрасывается FilesystemError.
 */

#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "nodeconfig.hpp"

/**
 * @struct ClusterInfo
 * @brief Кластер, выведенный из значений NodeConfig::cluster
 */
struct ClusterInfo {
  std::string name;
  std::vector<std::string> members;
};

/**
 * @struct IntegrityReport
 * @brief Результат сверки реестра с файловой системой
 */
struct IntegrityReport {
  bool valid = true;
  std::vector<std::string> issues;
};

class NodeRegistry {
 public:
  /// Реестр только в памяти
  NodeRegistry() = default;

  /**
   * @brief Реестр, сохраняемый в registryFile
   * @throw std::runtime_error Существующий файл повреждён
   */
  explicit NodeRegistry(std::string registryFile);

  NodeRegistry(const NodeRegistry &) = delete;
  NodeRegistry &operator=(const NodeRegistry &) = delete;

  std::vector<NodeConfig> snapshot() const;
  std::optional<NodeConfig> find(const std::string &name) const;
  bool contains(const std::string &name) const;
  size_t size() const;

  /**
   * @brief Добавляет новую запись
   * @throw ConflictError Нарушение уникальности относительно текущих записей
   * @throw FilesystemError Не удалось сохранить файл реестра
   */
  void insert(const NodeConfig &config);

  /**
   * @brief Заменяет запись originalName на updated (возможно переименование)
   * @throw NodeNotFoundError Записи originalName нет
   * @throw ConflictError, FilesystemError Как для insert()
   */
  void replace(const std::string &originalName, const NodeConfig &updated);

  /**
   * @brief Удаляет запись
   * @return false, если записи не было
   */
  bool remove(const std::string &name);

  /// Кластеры в алфавитном порядке, члены в порядке имён
  std::vector<ClusterInfo> clusters() const;

  /**
   * @brief Сверяет записи с диском
   *
   * @param nodesRoot Каталог, в котором лежат каталоги узлов
   * (<base>/nodes); каталоги без записи в реестре считаются осиротевшими
   */
  IntegrityReport verify(const std::string &nodesRoot) const;

  const std::string &registryFile() const { return registryFile_; }

 private:
  void load();
  void persistLocked() const;
  void checkInvariantsLocked(const NodeConfig &candidate,
                             const std::string &excluded) const;

  std::string registryFile_;
  std::map<std::string, NodeConfig> nodes_;
  mutable std::shared_mutex mutex_;
};
