#include "../include/nodelocktable.hpp"

#include <algorithm>

NodeLockTable::Guard::Guard(NodeLockTable *table,
                            std::vector<std::string> names)
    : table_(table), names_(std::move(names)) {}

NodeLockTable::Guard::Guard(Guard &&other) noexcept
    : table_(other.table_), names_(std::move(other.names_)) {
  other.table_ = nullptr;
}

NodeLockTable::Guard::~Guard() {
  if (table_) table_->release(names_);
}

NodeLockTable::Entry *NodeLockTable::acquireEntry(const std::string &name) {
  std::lock_guard lock(tableMutex_);
  auto &slot = entries_[name];
  if (!slot) slot = std::make_unique<Entry>();
  ++slot->refs;
  return slot.get();
}

void NodeLockTable::release(const std::vector<std::string> &names) {
  std::lock_guard lock(tableMutex_);
  for (const auto &name : names) {
    auto it = entries_.find(name);
    if (it == entries_.end()) continue;
    it->second->mutex.unlock();
    if (--it->second->refs == 0) {
      entries_.erase(it);
    }
  }
}

NodeLockTable::Guard NodeLockTable::lock(const std::string &name) {
  Entry *entry = acquireEntry(name);
  entry->mutex.lock();
  return Guard(this, {name});
}

NodeLockTable::Guard NodeLockTable::lockPair(const std::string &first,
                                             const std::string &second) {
  if (first == second) return lock(first);

  Entry *a = acquireEntry(first);
  Entry *b = acquireEntry(second);
  std::lock(a->mutex, b->mutex);
  return Guard(this, {first, second});
}

NodeLockTable::Guard NodeLockTable::lockAll(std::vector<std::string> names) {
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());

  Guard guard(this, {});
  for (const auto &name : names) {
    acquireEntry(name)->mutex.lock();
    guard.names_.push_back(name);
  }
  return guard;
}

size_t NodeLockTable::activeEntries() const {
  std::lock_guard lock(tableMutex_);
  return entries_.size();
}
