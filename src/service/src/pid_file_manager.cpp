#include "../include/pid_file_manager.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace {
constexpr mode_t kPidFileMode = 0644;
}

PidFileManager::PidFileManager(std::string path) : path_(std::move(path)) {}

void PidFileManager::write(pid_t pid) {
  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    throw std::system_error(errno, std::system_category(),
                            "PidFileManager: Cannot open PID file: " + path_);
  }
  out << pid << '\n';
  out.flush();
  if (!out) {
    throw std::system_error(errno, std::system_category(),
                            "PidFileManager: Failed to write PID file: " + path_);
  }
  if (chmod(path_.c_str(), kPidFileMode) < 0) {
    throw std::system_error(errno, std::system_category(),
                            "PidFileManager: Failed to set PID file permissions");
  }
}

std::optional<pid_t> PidFileManager::read() const {
  std::ifstream in(path_);
  if (!in) return std::nullopt;
  pid_t pid = 0;
  in >> pid;
  if (!in || pid <= 0) return std::nullopt;
  return pid;
}

bool PidFileManager::exists() const { return read().has_value(); }

void PidFileManager::remove() noexcept { std::remove(path_.c_str()); }
