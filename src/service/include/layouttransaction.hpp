/**
 * @file layouttransaction.hpp
 * @date October 2026
 * @brief Транзакция над каталогами узла с откатом
 *
 * @details
 * Накапливает два списка путей: созданные в ходе операции (удаляются при
 * откате) и подлежащие удалению после успешной фиксации (старое
 * расположение узла при перемещении). Если транзакция не была
 * зафиксирована, деструктор выполняет откат.
 *
 * @code
 auto txn = materializer.relocate(current, moved, true);
 registry.replace(current.name, moved);  // при исключении откат в ~txn
 txn.commit();
 @endcode
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

class LayoutTransaction {
 public:
  explicit LayoutTransaction(std::string description);
  ~LayoutTransaction();

  LayoutTransaction(LayoutTransaction &&other) noexcept;
  LayoutTransaction &operator=(LayoutTransaction &&) = delete;
  LayoutTransaction(const LayoutTransaction &) = delete;
  LayoutTransaction &operator=(const LayoutTransaction &) = delete;

  /// Путь создан этой операцией и удаляется при откате
  void trackCreated(const std::filesystem::path &path);

  /// Промежуточный каталог: при откате удаляется, только если пуст
  void trackCreatedParent(const std::filesystem::path &path);

  /// Путь удаляется после фиксации
  void discardOnCommit(const std::filesystem::path &path);

  /**
   * @brief Фиксирует операцию и удаляет пути discardOnCommit()
   *
   * @details
   * Ошибки удаления старых путей журналируются и не отменяют фиксацию:
   * реестр к этому моменту уже указывает на новое расположение.
   *
   * @throws std::runtime_error если транзакция не активна.
   */
  void commit();

  /**
   * @brief Удаляет созданные пути в обратном порядке
   * @throws std::runtime_error если транзакция не активна.
   */
  void rollback();

  bool active() const { return active_; }

 private:
  std::string description_;
  struct Created {
    std::filesystem::path path;
    bool recursive;
  };

  std::vector<Created> created_;
  std::vector<std::filesystem::path> discarded_;
  bool active_ = true;
};
