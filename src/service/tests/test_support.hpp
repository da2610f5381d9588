/**
 * @file test_support.hpp
 * @brief Общие заглушки для тестов службы: память, ожидание, супервизор.
 */
#pragma once

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>

#include "../include/nodeconfig.hpp"
#include "../include/processsupervisor.hpp"
#include "../include/systemmemory.hpp"
#include "../include/waitstrategy.hpp"

namespace testsupport {

inline constexpr std::uint64_t kGiB = 1024ull * 1024ull * 1024ull;

class FixedMemoryReporter : public ISystemMemoryReporter {
 public:
  explicit FixedMemoryReporter(std::uint64_t bytes = 8 * kGiB) : bytes_(bytes) {}
  std::uint64_t totalMemoryBytes() const override { return bytes_; }

 private:
  std::uint64_t bytes_;
};

class MockSupervisor : public IProcessSupervisor {
 public:
  MOCK_METHOD(void, launch, (const NodeConfig &), (override));
  MOCK_METHOD(void, terminate, (const NodeConfig &), (override));
  MOCK_METHOD(HealthStatus, healthProbe, (const NodeConfig &), (override));
};

/// Ожидание без задержки, только проверка отмены
class ImmediateWait : public IWaitStrategy {
 public:
  bool waitFor(std::chrono::milliseconds,
               const std::function<bool()> &cancelled) override {
    ++calls;
    return !cancelled();
  }
  std::atomic<int> calls{0};
};

/// Ожидание, которое держит цикл до open() или отмены
class GatedWait : public IWaitStrategy {
 public:
  bool waitFor(std::chrono::milliseconds,
               const std::function<bool()> &cancelled) override {
    std::unique_lock lock(mutex_);
    ++waiting_;
    cv_.notify_all();
    while (!open_) {
      if (cancelled()) {
        --waiting_;
        return false;
      }
      cv_.wait_for(lock, std::chrono::milliseconds(5));
    }
    --waiting_;
    return true;
  }

  void open() {
    std::lock_guard lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

  /// Ждёт, пока цикл согласования не встанет на ожидание
  bool awaitWaiter(std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, limit, [this] { return waiting_ > 0; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  int waiting_ = 0;
};

inline HealthStatus stopped() { return HealthStatus{false, std::nullopt}; }
inline HealthStatus running(pid_t pid = 4242) { return HealthStatus{true, pid}; }

/// Временный каталог, удаляемый вместе с содержимым
class TempDir {
 public:
  explicit TempDir(const std::string &prefix = "steward") {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(rd()) + "_" +
             std::to_string(std::chrono::steady_clock::now()
                                .time_since_epoch()
                                .count()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path &path() const { return path_; }
  std::string str() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

inline NodeConfig makeNode(const std::string &name, int http, int transport,
                           const std::string &cluster = kDefaultCluster) {
  NodeConfig config;
  config.name = name;
  config.httpPort = http;
  config.transportPort = transport;
  config.cluster = cluster;
  config.dataPath = "/srv/" + name + "/data";
  config.logsPath = "/srv/" + name + "/logs";
  config.configPath = "/srv/" + name + "/config/elasticsearch.yml";
  return config;
}

}  // namespace testsupport
