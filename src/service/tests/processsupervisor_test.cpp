#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "../include/errors.hpp"
#include "../include/pid_file_manager.hpp"
#include "../include/processsupervisor.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using testsupport::TempDir;

namespace {

NodeConfig nodeIn(const fs::path &root) {
  fs::create_directories(root / "config");
  fs::create_directories(root / "logs");
  NodeConfig config;
  config.name = "sleeper";
  config.host = "127.0.0.1";
  config.configPath = (root / "config" / "elasticsearch.yml").string();
  config.logsPath = (root / "logs").string();
  return config;
}

/// Слушающий сокет на свободном порту loopback
class Listener {
 public:
  Listener() {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || bind(fd_, reinterpret_cast<sockaddr *>(&addr), len) != 0 ||
        listen(fd_, 4) != 0 ||
        getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
      throw std::runtime_error("Listener: cannot open loopback socket");
    }
    port_ = ntohs(addr.sin_port);
  }
  ~Listener() { close(); }
  void close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }
  int port() const { return port_; }

 private:
  int fd_ = -1;
  int port_ = 0;
};

}  // namespace

TEST(PidFileManagerTest, WriteReadRemove) {
  TempDir dir;
  PidFileManager pidFile((dir.path() / "node.pid").string());

  EXPECT_FALSE(pidFile.exists());
  pidFile.write(12345);
  ASSERT_TRUE(pidFile.read().has_value());
  EXPECT_EQ(*pidFile.read(), 12345);

  pidFile.remove();
  EXPECT_FALSE(pidFile.exists());
  EXPECT_NO_THROW(pidFile.remove());
}

TEST(PidFileManagerTest, GarbageContentIsNoPid) {
  TempDir dir;
  const auto path = (dir.path() / "node.pid").string();
  std::ofstream(path) << "not-a-pid";

  EXPECT_FALSE(PidFileManager(path).read().has_value());
  EXPECT_THROW(PidFileManager((dir.path() / "missing" / "node.pid").string())
                   .write(1),
               std::system_error);
}

TEST(PosixProcessSupervisorTest, ProbeWithoutPidFileReportsStopped) {
  TempDir dir;
  PosixProcessSupervisor supervisor(false);
  auto status = supervisor.healthProbe(nodeIn(dir.path()));

  EXPECT_FALSE(status.isRunning);
  EXPECT_FALSE(status.pid.has_value());
}

TEST(PosixProcessSupervisorTest, LaunchWithoutLauncherFails) {
  TempDir dir;
  PosixProcessSupervisor supervisor(false);
  EXPECT_THROW(supervisor.launch(nodeIn(dir.path())), SupervisorError);
}

TEST(PosixProcessSupervisorTest, PortProbeRequiresListeningSocket) {
  TempDir dir;
  auto config = nodeIn(dir.path());
  PidFileManager(PosixProcessSupervisor::pidFilePath(config)).write(getpid());

  Listener listener;
  config.httpPort = listener.port();
  PosixProcessSupervisor supervisor(true, 200ms);

  auto up = supervisor.healthProbe(config);
  EXPECT_TRUE(up.isRunning);
  EXPECT_EQ(up.pid, getpid());

  listener.close();
  auto down = supervisor.healthProbe(config);
  EXPECT_FALSE(down.isRunning);
  EXPECT_TRUE(down.pid.has_value());
}

// Полный цикл: запуск лаунчера, проверка процесса, SIGTERM
TEST(PosixProcessSupervisorTest, LaunchProbeTerminate) {
  TempDir dir;
  auto config = nodeIn(dir.path());
  {
    std::ofstream script(PosixProcessSupervisor::launcherPath(config));
    script << "#!/bin/sh\nexec sleep 30\n";
  }

  PosixProcessSupervisor supervisor(false);
  supervisor.launch(config);

  auto status = supervisor.healthProbe(config);
  ASSERT_TRUE(status.isRunning);
  ASSERT_TRUE(status.pid.has_value());
  EXPECT_NE(*status.pid, getpid());

  supervisor.terminate(config);

  bool stopped = false;
  for (int i = 0; i < 100 && !stopped; ++i) {
    stopped = !supervisor.healthProbe(config).isRunning;
    if (!stopped) std::this_thread::sleep_for(50ms);
  }
  EXPECT_TRUE(stopped);
}
