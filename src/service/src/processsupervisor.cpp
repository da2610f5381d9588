#include "../include/processsupervisor.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "../include/errors.hpp"
#include "../include/pid_file_manager.hpp"
#include "steward/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

std::string errnoText(int err) { return std::strerror(err); }

/// Закрывает дескриптор при выходе из области видимости
class FdGuard {
 public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) close(fd_);
  }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;
  int get() const { return fd_; }

 private:
  int fd_;
};

/// Зомби, которого не успел забрать init, считается завершённым
bool isZombie(pid_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return false;
  std::string line;
  std::getline(stat, line);
  const auto paren = line.rfind(')');
  return paren != std::string::npos && paren + 2 < line.size() &&
         line[paren + 2] == 'Z';
}

bool processAlive(pid_t pid) {
  if (kill(pid, 0) != 0 && errno != EPERM) return false;
  return !isZombie(pid);
}

}  // namespace

PosixProcessSupervisor::PosixProcessSupervisor(
    bool probePort, std::chrono::milliseconds connectTimeout)
    : probePort_(probePort), connectTimeout_(connectTimeout) {}

std::string PosixProcessSupervisor::pidFilePath(const NodeConfig &config) {
  return (fs::path(config.configPath).parent_path() / "node.pid").string();
}

std::string PosixProcessSupervisor::launcherPath(const NodeConfig &config) {
  return (fs::path(config.configPath).parent_path() / "start-node.sh").string();
}

void PosixProcessSupervisor::launch(const NodeConfig &config) {
  const std::string script = launcherPath(config);
  std::error_code ec;
  if (!fs::exists(script, ec)) {
    throw SupervisorError("PosixProcessSupervisor: Launcher not found: " +
                          script);
  }

  int channel[2];
  if (pipe(channel) < 0) {
    throw SupervisorError("PosixProcessSupervisor: pipe failed: " +
                          errnoText(errno));
  }
  FdGuard readEnd(channel[0]);

  pid_t child = fork();
  if (child < 0) {
    const int err = errno;
    close(channel[1]);
    throw SupervisorError("PosixProcessSupervisor: First fork failed: " +
                          errnoText(err));
  }

  if (child == 0) {
    // Промежуточный процесс: новая сессия и второй fork
    close(channel[0]);
    if (setsid() < 0) _exit(EXIT_FAILURE);

    pid_t node = fork();
    if (node < 0) _exit(EXIT_FAILURE);
    if (node > 0) {
      ssize_t written = ::write(channel[1], &node, sizeof(node));
      _exit(written == static_cast<ssize_t>(sizeof(node)) ? EXIT_SUCCESS
                                                          : EXIT_FAILURE);
    }

    close(channel[1]);
    umask(022);
    const std::string logFile =
        (fs::path(config.logsPath) / "startup.log").string();
    int out = open(logFile.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (out < 0) out = open("/dev/null", O_WRONLY);
    int in = open("/dev/null", O_RDONLY);
    if (in >= 0) dup2(in, STDIN_FILENO);
    if (out >= 0) {
      dup2(out, STDOUT_FILENO);
      dup2(out, STDERR_FILENO);
    }
    execl("/bin/sh", "sh", script.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  close(channel[1]);
  int status = 0;
  while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
  }

  pid_t nodePid = 0;
  ssize_t got = 0;
  do {
    got = ::read(readEnd.get(), &nodePid, sizeof(nodePid));
  } while (got < 0 && errno == EINTR);

  if (got != static_cast<ssize_t>(sizeof(nodePid)) || nodePid <= 0) {
    throw SupervisorError("PosixProcessSupervisor: Failed to launch node \"" +
                          config.name + "\"");
  }

  try {
    PidFileManager(pidFilePath(config)).write(nodePid);
  } catch (const std::system_error &e) {
    kill(nodePid, SIGTERM);
    throw SupervisorError("PosixProcessSupervisor: " + std::string(e.what()));
  }

  steward::CompositeLogger::instance().info(
      "PosixProcessSupervisor: Node \"" + config.name +
      "\" launched with PID " + std::to_string(nodePid));
}

void PosixProcessSupervisor::terminate(const NodeConfig &config) {
  PidFileManager pidFile(pidFilePath(config));
  const auto pid = pidFile.read();
  if (!pid) {
    steward::CompositeLogger::instance().warning(
        "PosixProcessSupervisor: No PID file for node \"" + config.name + "\"");
    return;
  }

  if (kill(*pid, SIGTERM) < 0) {
    if (errno == ESRCH) {
      pidFile.remove();
      return;
    }
    throw SupervisorError("PosixProcessSupervisor: Failed to signal PID " +
                          std::to_string(*pid) + ": " + errnoText(errno));
  }

  steward::CompositeLogger::instance().info(
      "PosixProcessSupervisor: SIGTERM sent to node \"" + config.name +
      "\" (PID " + std::to_string(*pid) + ")");
}

HealthStatus PosixProcessSupervisor::healthProbe(const NodeConfig &config) {
  HealthStatus status;
  const auto pid = PidFileManager(pidFilePath(config)).read();
  if (!pid || !processAlive(*pid)) {
    return status;
  }

  status.pid = pid;
  status.isRunning =
      !probePort_ || portAcceptsConnections(config.host, config.httpPort);
  return status;
}

bool PosixProcessSupervisor::portAcceptsConnections(const std::string &host,
                                                    int port) const {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *list = nullptr;
  const std::string service = std::to_string(port);
  if (getaddrinfo(host.c_str(), service.c_str(), &hints, &list) != 0) {
    return false;
  }

  bool connected = false;
  for (addrinfo *ai = list; ai && !connected; ai = ai->ai_next) {
    FdGuard sock(socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK,
                        ai->ai_protocol));
    if (sock.get() < 0) continue;

    if (connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
      connected = true;
      break;
    }
    if (errno != EINPROGRESS) continue;

    pollfd pfd{sock.get(), POLLOUT, 0};
    if (poll(&pfd, 1, static_cast<int>(connectTimeout_.count())) == 1) {
      int error = 0;
      socklen_t len = sizeof(error);
      if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len) == 0 &&
          error == 0) {
        connected = true;
      }
    }
  }

  freeaddrinfo(list);
  return connected;
}
