#include "../include/systemmemory.hpp"

#include <unistd.h>

#include <cerrno>
#include <system_error>

std::uint64_t SysconfMemoryReporter::totalMemoryBytes() const {
  errno = 0;
  const long pages = sysconf(_SC_PHYS_PAGES);
  const long pageSize = sysconf(_SC_PAGESIZE);
  if (pages <= 0 || pageSize <= 0) {
    throw std::system_error(errno ? errno : EINVAL, std::system_category(),
                            "SysconfMemoryReporter: Cannot read memory size");
  }
  return static_cast<std::uint64_t>(pages) *
         static_cast<std::uint64_t>(pageSize);
}
