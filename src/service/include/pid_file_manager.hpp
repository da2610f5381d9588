#pragma once
#include <sys/types.h>

#include <optional>
#include <string>

/// PID-файл запущенного узла (<config>/node.pid).
class PidFileManager {
 public:
  explicit PidFileManager(std::string path);

  /// Записать pid в файл, перезаписав прежнее содержимое.
  /// @throws std::system_error при ошибке записи.
  void write(pid_t pid);

  /// PID из файла; пусто, если файла нет или содержимое не число.
  std::optional<pid_t> read() const;

  bool exists() const;

  /// Удалить PID-файл. Без ошибок, если файла нет.
  void remove() noexcept;

  const std::string &path() const { return path_; }

 private:
  std::string path_;
};
