#pragma once

#include <cstddef>

namespace steward {

/// Ротация файла журнала по размеру: app.log -> app.log.1
struct RotationConfig {
  bool enabled = false;
  std::size_t maxFileSizeBytes = 0;
};

class IRotatableLogger {
 public:
  virtual void setRotationConfig(const RotationConfig& config) = 0;
  virtual RotationConfig getRotationConfig() const = 0;
  virtual ~IRotatableLogger() = default;
};

}  // namespace steward
