/**
 * @file nodematerializer.hpp
 * @date October 2026
 * @brief Размещение узла на диске: каталоги, файлы конфигурации, перенос
 *
 * @details
 * Стандартное расположение узла:
 * @code
 <base>/nodes/<name>/
     config/elasticsearch.yml, jvm.options, log4j2.properties, start-node.sh
     data/
     logs/
 @endcode
 * При перемещении или копировании каталогом узла становится указанный
 * целевой путь. Материализатор не проверяет уникальность (это задача
 * NodeValidator), только пригодность путей.
 */

#pragma once

#include <filesystem>
#include <string>

#include "layouttransaction.hpp"
#include "nodeconfig.hpp"

struct NodeLayout {
  std::filesystem::path root;
  std::filesystem::path configDir;
  std::filesystem::path dataDir;
  std::filesystem::path logsDir;

  static NodeLayout at(const std::filesystem::path &nodeDir);
};

struct MaterializerOptions {
  std::string basePath;
  std::string engineExecutable;
};

class NodeMaterializer {
 public:
  /// Имена файлов в каталоге конфигурации
  static constexpr const char *kConfigFile = "elasticsearch.yml";
  static constexpr const char *kJvmFile = "jvm.options";
  static constexpr const char *kLog4jFile = "log4j2.properties";
  static constexpr const char *kLauncherFile = "start-node.sh";
  static constexpr const char *kPidFile = "node.pid";

  explicit NodeMaterializer(MaterializerOptions options);

  /// <base>/nodes
  std::filesystem::path nodesRoot() const;

  /// Стандартное расположение узла по имени
  NodeLayout defaultLayout(const std::string &name) const;

  /**
   * @brief Привязывает конфигурацию к расположению
   *
   * @details
   * configPath всегда указывает в layout.configDir. Пустые dataPath и
   * logsPath, а при force и непустые, заменяются каталогами layout.
   */
  static NodeConfig bind(NodeConfig config, const NodeLayout &layout,
                         bool force = false);

  /// Расположение существующего узла по его configPath
  static NodeLayout layoutOf(const NodeConfig &config);

  /**
   * @brief Создаёт каталоги и файлы нового узла
   *
   * @details
   * Существующие пустые каталоги используются, но не попадают в
   * транзакцию: откат удаляет только то, что создал этот вызов.
   *
   * @return Активная транзакция; фиксируется после записи в реестр
   * @throw FilesystemError Путь занят посторонним содержимым или не
   *        доступен для записи; созданное к этому моменту удаляется
   */
  LayoutTransaction create(const NodeConfig &config);

  /**
   * @brief Перегенерирует файлы конфигурации и создаёт недостающие каталоги
   * @throw FilesystemError
   */
  void rewriteConfig(const NodeConfig &config);

  /**
   * @brief Применяет изменённую конфигурацию существующего узла
   *
   * @details
   * Новые dataPath и logsPath проверяются так же, как при создании.
   * Откат удаляет созданные каталоги; файлы конфигурации восстанавливает
   * вызывающий через rewriteConfig().
   *
   * @throw FilesystemError Новый путь занят посторонним содержимым
   */
  LayoutTransaction reconfigure(const NodeConfig &current,
                                const NodeConfig &updated);

  /**
   * @brief Подготавливает перемещение узла
   *
   * @param source Текущая запись реестра
   * @param target Запись с новыми путями (bind() к новому расположению)
   * @param preserveData true: копировать data и logs; false: создать пустые
   *
   * @return Активная транзакция; старые каталоги удаляются в commit()
   * @throw FilesystemError Целевой каталог существует или копирование не
   *        удалось; созданное удаляется, источник не изменяется
   */
  LayoutTransaction relocate(const NodeConfig &source, const NodeConfig &target,
                             bool preserveData);

  /**
   * @brief Подготавливает копию узла под новым именем
   * @param copyData Копировать содержимое data источника
   * @throw FilesystemError Как для relocate()
   */
  LayoutTransaction duplicate(const NodeConfig &source,
                              const NodeConfig &target, bool copyData);

  /**
   * @brief Удаляет файлы узла
   * @param preserveData Удалить только каталог конфигурации
   * @throw FilesystemError
   */
  void remove(const NodeConfig &config, bool preserveData);

  std::string renderElasticsearchYml(const NodeConfig &config) const;
  std::string renderJvmOptions(const NodeConfig &config) const;
  std::string renderLog4j(const NodeConfig &config) const;
  std::string renderLauncher(const NodeConfig &config) const;

 private:
  void writeConfigFiles(const NodeConfig &config) const;
  void writeFile(const std::filesystem::path &path, const std::string &content,
                 bool executable = false) const;
  void ensureUsable(const std::filesystem::path &path) const;
  void makeDirectory(const std::filesystem::path &path,
                     LayoutTransaction &txn) const;
  void copyTree(const std::filesystem::path &from,
                const std::filesystem::path &to) const;
  void copyExtraConfig(const NodeConfig &source, const NodeConfig &target) const;
  LayoutTransaction prepareTarget(const NodeConfig &target,
                                  const std::string &description) const;

  std::filesystem::path basePath_;
  std::string engineExecutable_;
};
