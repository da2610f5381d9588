#include "../include/waitstrategy.hpp"

#include <algorithm>
#include <thread>

bool SteadyWaitStrategy::waitFor(std::chrono::milliseconds interval,
                                 const std::function<bool()> &cancelled) {
  constexpr std::chrono::milliseconds kSlice(100);
  const auto deadline = std::chrono::steady_clock::now() + interval;

  while (true) {
    if (cancelled && cancelled()) return false;
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return true;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        kSlice, deadline - now));
  }
}
