/**
 * @file nodelocktable.hpp
 * @date October 2026
 * @brief Таблица мьютексов, индексированных именем узла
 *
 * @details
 * Мутирующие операции удерживают блокировку только своего узла (и, для
 * переименования или копирования, второго имени), поэтому операции над
 * разными узлами выполняются параллельно. Запись таблицы существует, пока
 * на неё есть хотя бы один Guard.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class NodeLockTable {
 public:
  /**
   * @class Guard
   * @brief RAII-владение блокировками одного или двух имён
   */
  class Guard {
   public:
    Guard(Guard &&other) noexcept;
    Guard &operator=(Guard &&) = delete;
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    ~Guard();

   private:
    friend class NodeLockTable;
    Guard(NodeLockTable *table, std::vector<std::string> names);

    NodeLockTable *table_;
    std::vector<std::string> names_;
  };

  /// Блокирует одно имя
  Guard lock(const std::string &name);

  /**
   * @brief Блокирует два имени без риска взаимоблокировки
   * @details При совпадении имён берётся одна блокировка.
   */
  Guard lockPair(const std::string &first, const std::string &second);

  /**
   * @brief Блокирует набор ключей в порядке сортировки
   * @details Повторяющиеся ключи блокируются один раз.
   */
  Guard lockAll(std::vector<std::string> names);

  /// Количество записей в таблице (для тестов)
  size_t activeEntries() const;

 private:
  struct Entry {
    std::mutex mutex;
    int refs = 0;
  };

  Entry *acquireEntry(const std::string &name);
  void release(const std::vector<std::string> &names);

  mutable std::mutex tableMutex_;
  std::map<std::string, std::unique_ptr<Entry>> entries_;
};
