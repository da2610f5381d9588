/**
 * @file systemmemory.hpp
 * @date October 2026
 * @brief Источник сведений об объёме физической памяти
 */

#pragma once

#include <cstdint>

class ISystemMemoryReporter {
 public:
  virtual ~ISystemMemoryReporter() = default;

  /// Общий объём физической памяти в байтах
  virtual std::uint64_t totalMemoryBytes() const = 0;
};

/**
 * @class SysconfMemoryReporter
 * @brief _SC_PHYS_PAGES * _SC_PAGESIZE
 * @throw std::system_error Если sysconf не смог определить значения
 */
class SysconfMemoryReporter : public ISystemMemoryReporter {
 public:
  std::uint64_t totalMemoryBytes() const override;
};
