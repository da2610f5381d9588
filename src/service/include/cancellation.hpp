/**
 * @file cancellation.hpp
 * @date October 2026
 * @brief Отмена ожидания, инициированного сеансом управления
 *
 * @details
 * ManagementSession выдаёт токены операциям, запущенным в рамках сеанса.
 * Закрытие сеанса отменяет все его токены: ожидание результата
 * согласования прекращается, но команда запуска или остановки, уже
 * переданная процессу, не отзывается.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { state_->store(true); }
  bool isCancelled() const { return state_->load(); }

 private:
  std::shared_ptr<std::atomic<bool>> state_;
};

class ManagementSession {
 public:
  ManagementSession() = default;
  ~ManagementSession() { close(); }

  ManagementSession(const ManagementSession &) = delete;
  ManagementSession &operator=(const ManagementSession &) = delete;

  /// Новый токен; после close() выдаётся уже отменённым
  CancellationToken newToken() {
    std::lock_guard lock(mutex_);
    CancellationToken token;
    if (closed_) token.cancel();
    tokens_.push_back(token);
    return token;
  }

  void close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
    for (const auto &token : tokens_) token.cancel();
  }

  bool isClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<CancellationToken> tokens_;
  bool closed_ = false;
};
