/**
 * @file waitstrategy.hpp
 * @date October 2026
 * @brief Пауза между опросами цикла согласования
 */

#pragma once

#include <chrono>
#include <functional>

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  /**
   * @brief Ждёт interval или до отмены
   * @return false, если ожидание прервано cancelled()
   */
  virtual bool waitFor(std::chrono::milliseconds interval,
                       const std::function<bool()> &cancelled) = 0;
};

/// Сон квантами по 100 мс с проверкой отмены
class SteadyWaitStrategy : public IWaitStrategy {
 public:
  bool waitFor(std::chrono::milliseconds interval,
               const std::function<bool()> &cancelled) override;
};
